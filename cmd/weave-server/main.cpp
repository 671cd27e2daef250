#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/samples/simple_workflow.hpp"

using weave::factory::Build;
using weave::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: weave-server <config.yaml> OR weave-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = weave::config::ConfigLoader::LoadFromYaml(config_path);

    weave::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto engine = Build(config);
    weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);

    // ------------------------------------------------------------
    // Start engine + server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), weave::runtime::BuildServices(engine.orchestrator, weave::factory::BackendName(config)));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine.Start();
    server.Start();
    WEAVE_LOG_INFO("weave server started", {weave::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WEAVE_LOG_INFO("Shutting down weave server");

    server.Stop();
    engine.Stop();
    weave::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WEAVE_LOG_ERROR("Fatal error", {weave::observability::StringField("error", e.what())});
    weave::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
