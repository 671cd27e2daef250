#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/history/event_log.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/time.hpp"
#include "weave/v1/common.pb.h"
#include "weave/v1/history.pb.h"

namespace weave::core {

struct OrchestratorOptions {
  std::string                      default_task_queue   = "default";
  weave::v1::WorkflowIdReusePolicy default_reuse_policy = weave::v1::WORKFLOW_ID_REUSE_POLICY_REJECT_DUPLICATE;
  util::Millis                     result_poll_interval{50};
};

struct StartWorkflowOptions {
  std::string  workflow_id; // generated when empty
  std::string  task_queue;  // default task queue when empty
  util::Millis execution_timeout{0};

  // UNSPECIFIED falls back to OrchestratorOptions::default_reuse_policy
  weave::v1::WorkflowIdReusePolicy reuse_policy = weave::v1::WORKFLOW_ID_REUSE_POLICY_UNSPECIFIED;
};

struct StartedWorkflow {
  std::string workflow_id;
  std::string run_id;
};

struct WorkflowOutcome {
  db::model::RunRecord run;
  bool                 still_running = false;

  // set for FAILED, TERMINATED and TIMED_OUT
  std::optional<weave::v1::Failure> failure;
};

struct WorkflowHistory {
  std::string                          run_id;
  std::vector<weave::v1::HistoryEvent> events;
};

struct EngineStats {
  uint64_t runs_running    = 0;
  uint64_t runs_completed  = 0;
  uint64_t runs_failed     = 0;
  uint64_t runs_terminated = 0;
  uint64_t runs_timed_out  = 0;

  std::vector<queue::QueueDepth> queues;
};

struct StoreHealth {
  bool        ok = true;
  std::string error;
};

/*
  Client-facing entry point of the engine.

  Holds no per-workflow state: every operation reads the store, appends
  to the event log and enqueues follow-on tasks in one transaction. The
  event log's optimistic version check is the only thing serializing
  progress on a run.

  Operations address the latest run of a workflow id.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
               std::shared_ptr<queue::TaskQueue> task_queue, OrchestratorOptions options = {});

  /*
    Records WorkflowStarted and enqueues the first decision task.

    Throws:
      InvalidArgument  empty workflow type or negative timeout
      AlreadyExists    an open run exists and the reuse policy rejects duplicates
  */
  StartedWorkflow StartWorkflow(const std::string& workflow_type, const std::string& input, const StartWorkflowOptions& options);

  // Latest run; throws NotFound.
  db::model::RunRecord GetStatus(const std::string& workflow_id);

  // Blocks up to `wait` for the latest run to close. still_running is set on timeout.
  WorkflowOutcome GetResult(const std::string& workflow_id, util::Millis wait);

  WorkflowHistory GetHistory(const std::string& workflow_id, uint64_t from_sequence = 0);

  // Idempotent while the cancel request is outstanding. Throws InvalidState on a closed run.
  void RequestCancel(const std::string& workflow_id, const std::string& reason);

  /*
    Records WorkflowSignaled on the open run and wakes the workflow with a
    decision task. Every signal is kept, in arrival order.

    Throws:
      InvalidArgument  empty signal name
      NotFound         unknown workflow id
      InvalidState     the latest run is closed
  */
  void SignalWorkflow(const std::string& workflow_id, const std::string& signal_name, const std::string& payload);

  // Closes the run immediately; pending tasks are discarded when delivered.
  void Terminate(const std::string& workflow_id, const std::string& reason);

  // Appends WorkflowTimedOut if the run is still open. Returns false otherwise.
  bool TimeOut(const std::string& run_id);

  EngineStats Stats();

  // One read transaction against the store.
  StoreHealth CheckStore();

  // Releases GetResult waiters.
  void Shutdown();

 private:
  db::model::RunRecord LatestRun(db::Transaction& tx, const std::string& workflow_id);
  void                 AppendClose(db::Transaction& tx, const db::model::RunRecord& run, weave::v1::HistoryEvent event);
  void                 EnqueueDecision(db::Transaction& tx, const db::model::RunRecord& run);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<history::EventLog> event_log_;
  std::shared_ptr<queue::TaskQueue>  task_queue_;
  OrchestratorOptions                options_;

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  bool                    shutdown_ = false;
};

} // namespace weave::core
