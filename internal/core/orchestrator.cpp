#include "orchestrator.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/api/db_error.hpp"
#include "internal/history/conflict_retry.hpp"
#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace weave::core {

using namespace weave::v1;
using weave::observability::StringField;

namespace {

bool HasCancelRequest(const std::vector<HistoryEvent>& events) {
  return std::any_of(events.begin(), events.end(),
                     [](const HistoryEvent& event) { return event.event_type() == EVENT_TYPE_WORKFLOW_CANCEL_REQUESTED; });
}

std::optional<Failure> CloseFailure(const db::model::RunRecord& run) {
  if (run.failure.empty()) return std::nullopt;
  Failure failure;
  if (!failure.ParseFromString(run.failure)) {
    throw std::runtime_error("corrupt failure payload for run " + run.run_id);
  }
  return failure;
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
                           std::shared_ptr<queue::TaskQueue> task_queue, OrchestratorOptions options)
    : repository_(std::move(repository)), event_log_(std::move(event_log)), task_queue_(std::move(task_queue)), options_(std::move(options)) {
}

db::model::RunRecord Orchestrator::LatestRun(db::Transaction& tx, const std::string& workflow_id) {
  if (workflow_id.empty()) throw util::InvalidArgument("workflow id is required");
  auto run = repository_->GetLatestRun(tx, workflow_id);
  if (!run.has_value()) throw util::NotFound("workflow not found: " + workflow_id);
  return *run;
}

void Orchestrator::AppendClose(db::Transaction& tx, const db::model::RunRecord& run, HistoryEvent event) {
  std::vector<HistoryEvent> events{std::move(event)};
  event_log_->Append(tx, run.run_id, run.last_sequence, events);
}

void Orchestrator::EnqueueDecision(db::Transaction& tx, const db::model::RunRecord& run) {
  TaskPayload payload;
  payload.mutable_decision()->set_workflow_id(run.workflow_id);
  payload.mutable_decision()->set_run_id(run.run_id);
  task_queue_->Enqueue(tx, queue::DecisionQueue(run.task_queue), payload);
}

StartedWorkflow Orchestrator::StartWorkflow(const std::string& workflow_type, const std::string& input, const StartWorkflowOptions& options) {
  if (workflow_type.empty()) throw util::InvalidArgument("StartWorkflow: workflow type is required");
  if (options.execution_timeout.count() < 0) throw util::InvalidArgument("StartWorkflow: execution timeout must not be negative");

  StartedWorkflow started;
  started.workflow_id = options.workflow_id.empty() ? util::NewId() : options.workflow_id;
  started.run_id      = util::NewId();

  const std::string task_queue = options.task_queue.empty() ? options_.default_task_queue : options.task_queue;
  const auto        policy =
      options.reuse_policy == WORKFLOW_ID_REUSE_POLICY_UNSPECIFIED ? options_.default_reuse_policy : options.reuse_policy;

  history::RetryOnConflict("StartWorkflow", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->LockWorkflowId(*tx, started.workflow_id), "StartWorkflow " + started.workflow_id);

    auto latest = repository_->GetLatestRun(*tx, started.workflow_id);
    if (latest.has_value() && latest->status == WORKFLOW_STATUS_RUNNING) {
      switch (policy) {
        case WORKFLOW_ID_REUSE_POLICY_ALLOW_DUPLICATE:
          break;
        case WORKFLOW_ID_REUSE_POLICY_TERMINATE_IF_RUNNING: {
          auto terminated = history::NewEvent(EVENT_TYPE_WORKFLOW_TERMINATED);
          terminated.mutable_workflow_terminated()->set_reason("superseded by run " + started.run_id);
          AppendClose(*tx, *latest, std::move(terminated));
          WEAVE_LOG_INFO("workflow run terminated by new start",
                         {StringField("workflow_id", started.workflow_id), StringField("run_id", latest->run_id)});
          break;
        }
        default:
          throw util::AlreadyExists("workflow " + started.workflow_id + " already has open run " + latest->run_id);
      }
    }

    auto  event = history::NewEvent(EVENT_TYPE_WORKFLOW_STARTED);
    auto* attrs = event.mutable_workflow_started();
    attrs->set_workflow_type(workflow_type);
    attrs->set_workflow_id(started.workflow_id);
    attrs->set_input(input);
    attrs->set_task_queue(task_queue);
    if (options.execution_timeout.count() > 0) *attrs->mutable_execution_timeout() = util::ToProto(options.execution_timeout);

    std::vector<HistoryEvent> events{std::move(event)};
    event_log_->Append(*tx, started.run_id, 0, events);

    TaskPayload payload;
    payload.mutable_decision()->set_workflow_id(started.workflow_id);
    payload.mutable_decision()->set_run_id(started.run_id);
    task_queue_->Enqueue(*tx, queue::DecisionQueue(task_queue), payload);

    tx->Commit();
  });
  task_queue_->Notify();

  WEAVE_LOG_INFO("workflow started", {StringField("workflow_id", started.workflow_id), StringField("run_id", started.run_id),
                                      StringField("workflow_type", workflow_type), StringField("task_queue", task_queue)});
  return started;
}

db::model::RunRecord Orchestrator::GetStatus(const std::string& workflow_id) {
  auto tx  = repository_->Begin();
  auto run = LatestRun(*tx, workflow_id);
  tx->Commit();
  return run;
}

WorkflowOutcome Orchestrator::GetResult(const std::string& workflow_id, util::Millis wait) {
  const auto deadline = std::chrono::steady_clock::now() + std::max(wait, util::Millis(0));

  for (;;) {
    WorkflowOutcome outcome;
    outcome.run = GetStatus(workflow_id);
    if (outcome.run.status != WORKFLOW_STATUS_RUNNING) {
      outcome.failure = CloseFailure(outcome.run);
      return outcome;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      outcome.still_running = true;
      return outcome;
    }

    std::unique_lock lock(wait_mutex_);
    if (wait_cv_.wait_until(lock, std::min(deadline, now + options_.result_poll_interval), [this] { return shutdown_; })) {
      outcome.still_running = true;
      return outcome;
    }
  }
}

WorkflowHistory Orchestrator::GetHistory(const std::string& workflow_id, uint64_t from_sequence) {
  WorkflowHistory out;
  {
    auto tx    = repository_->Begin();
    out.run_id = LatestRun(*tx, workflow_id).run_id;
    tx->Commit();
  }

  auto         cursor = event_log_->Read(out.run_id, from_sequence);
  HistoryEvent event;
  while (cursor.Next(event)) {
    out.events.push_back(event);
  }
  return out;
}

void Orchestrator::RequestCancel(const std::string& workflow_id, const std::string& reason) {
  const bool appended = history::RetryOnConflict("RequestCancel", [&] {
    auto tx  = repository_->Begin();
    auto run = LatestRun(*tx, workflow_id);
    if (run.status != WORKFLOW_STATUS_RUNNING) {
      throw util::InvalidState("workflow " + workflow_id + " is closed");
    }
    if (HasCancelRequest(event_log_->ReadAll(*tx, run.run_id))) {
      tx->Commit();
      return false;
    }

    auto event = history::NewEvent(EVENT_TYPE_WORKFLOW_CANCEL_REQUESTED);
    event.mutable_workflow_cancel_requested()->set_reason(reason);
    std::vector<HistoryEvent> events{std::move(event)};
    event_log_->Append(*tx, run.run_id, run.last_sequence, events);
    EnqueueDecision(*tx, run);

    tx->Commit();
    return true;
  });

  if (appended) {
    task_queue_->Notify();
    WEAVE_LOG_INFO("workflow cancel requested", {StringField("workflow_id", workflow_id), StringField("reason", reason)});
  }
}

void Orchestrator::SignalWorkflow(const std::string& workflow_id, const std::string& signal_name, const std::string& payload) {
  if (signal_name.empty()) throw util::InvalidArgument("SignalWorkflow: signal name is required");

  std::string run_id;
  history::RetryOnConflict("SignalWorkflow", [&] {
    auto tx  = repository_->Begin();
    auto run = LatestRun(*tx, workflow_id);
    if (run.status != WORKFLOW_STATUS_RUNNING) {
      throw util::InvalidState("workflow " + workflow_id + " is closed");
    }

    auto  event = history::NewEvent(EVENT_TYPE_WORKFLOW_SIGNALED);
    auto* attrs = event.mutable_workflow_signaled();
    attrs->set_signal_name(signal_name);
    attrs->set_payload(payload);
    std::vector<HistoryEvent> events{std::move(event)};
    event_log_->Append(*tx, run.run_id, run.last_sequence, events);
    EnqueueDecision(*tx, run);

    tx->Commit();
    run_id = run.run_id;
  });
  task_queue_->Notify();

  WEAVE_LOG_INFO("workflow signaled",
                 {StringField("workflow_id", workflow_id), StringField("run_id", run_id), StringField("signal", signal_name)});
}

void Orchestrator::Terminate(const std::string& workflow_id, const std::string& reason) {
  history::RetryOnConflict("Terminate", [&] {
    auto tx  = repository_->Begin();
    auto run = LatestRun(*tx, workflow_id);
    if (run.status != WORKFLOW_STATUS_RUNNING) {
      throw util::InvalidState("workflow " + workflow_id + " is closed");
    }

    auto event = history::NewEvent(EVENT_TYPE_WORKFLOW_TERMINATED);
    event.mutable_workflow_terminated()->set_reason(reason);
    AppendClose(*tx, run, std::move(event));
    tx->Commit();
  });

  WEAVE_LOG_INFO("workflow terminated", {StringField("workflow_id", workflow_id), StringField("reason", reason)});
}

bool Orchestrator::TimeOut(const std::string& run_id) {
  const bool timed_out = history::RetryOnConflict("TimeOut", [&] {
    auto tx  = repository_->Begin();
    auto run = repository_->GetRun(*tx, run_id);
    if (!run.has_value() || run->status != WORKFLOW_STATUS_RUNNING) {
      tx->Commit();
      return false;
    }

    AppendClose(*tx, *run, history::NewEvent(EVENT_TYPE_WORKFLOW_TIMED_OUT));
    tx->Commit();
    return true;
  });

  if (timed_out) WEAVE_LOG_INFO("workflow timed out", {StringField("run_id", run_id)});
  return timed_out;
}

EngineStats Orchestrator::Stats() {
  EngineStats stats;

  auto tx                = repository_->Begin();
  stats.runs_running     = repository_->ListRunsByStatus(*tx, WORKFLOW_STATUS_RUNNING).size();
  stats.runs_completed   = repository_->ListRunsByStatus(*tx, WORKFLOW_STATUS_COMPLETED).size();
  stats.runs_failed      = repository_->ListRunsByStatus(*tx, WORKFLOW_STATUS_FAILED).size();
  stats.runs_terminated  = repository_->ListRunsByStatus(*tx, WORKFLOW_STATUS_TERMINATED).size();
  stats.runs_timed_out   = repository_->ListRunsByStatus(*tx, WORKFLOW_STATUS_TIMED_OUT).size();

  for (const auto& queue_name : repository_->ListQueues(*tx)) {
    if (auto depth = task_queue_->Depth(*tx, queue_name)) stats.queues.push_back(std::move(*depth));
  }
  tx->Commit();
  return stats;
}

StoreHealth Orchestrator::CheckStore() {
  StoreHealth health;
  try {
    auto tx = repository_->Begin();
    repository_->ListQueues(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    health.ok    = false;
    health.error = e.what();
    WEAVE_LOG_WARN("store health check failed", {StringField("error", e.what())});
  }
  return health;
}

void Orchestrator::Shutdown() {
  {
    std::lock_guard lock(wait_mutex_);
    shutdown_ = true;
  }
  wait_cv_.notify_all();
}

} // namespace weave::core
