#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/orchestrator.hpp"
#include "internal/core/timeout_sweeper.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/history/event_log.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/worker/worker.hpp"
#include "internal/workflow/registry.hpp"

namespace weave::factory {

/*
  Engine

  Owns every long-lived component of one process. Register workflow and
  activity types on the registries before Start().
*/
struct Engine {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<history::EventLog>          event_log;
  std::shared_ptr<queue::TaskQueue>           task_queue;
  std::shared_ptr<core::Orchestrator>         orchestrator;
  std::shared_ptr<workflow::WorkflowRegistry> workflows;
  std::shared_ptr<workflow::ActivityRegistry> activities;
  std::shared_ptr<core::TimeoutSweeper>       sweeper;
  std::shared_ptr<worker::Worker>             worker;

  // worker pool + timeout sweeper
  void Start();

  // Stops background loops, waits for in-flight tasks and releases waiters.
  void Stop();
};

/*
  BuildRepository

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  The schema is bootstrapped before the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const weave::runtime::config::RuntimeConfig& config);

// "memory", "sqlite" or "postgres"
const char* BackendName(const weave::runtime::config::RuntimeConfig& config);

worker::WorkerOptions WorkerOptionsFromConfig(const weave::runtime::config::RuntimeConfig& config);

// Builds the full dependency graph; nothing is started.
Engine Build(const weave::runtime::config::RuntimeConfig& config);

} // namespace weave::factory
