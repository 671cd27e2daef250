#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/samples/simple_workflow.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// Standalone worker process: polls the shared store, serves no RPCs and
// runs no timeout sweeper.
int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: weave-worker <config.yaml> OR weave-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = weave::config::ConfigLoader::LoadFromYaml(config_path);
    weave::observability::InitializeLogging(config);

    if (!config.database().has_sqlite() && !config.database().has_postgres()) {
      WEAVE_LOG_WARN("worker is using a private in-memory store; no other process can enqueue work for it");
    }

    auto engine = weave::factory::Build(config);
    weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine.worker->Start();
    WEAVE_LOG_INFO("weave worker started", {weave::observability::StringField("task_queue", engine.worker->Options().task_queue)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WEAVE_LOG_INFO("Shutting down weave worker");

    engine.worker->Stop();
    engine.task_queue->Shutdown();
    weave::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WEAVE_LOG_ERROR("Fatal error", {weave::observability::StringField("error", e.what())});
    weave::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
