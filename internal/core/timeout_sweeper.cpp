#include "timeout_sweeper.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/errors.hpp"
#include "orchestrator.hpp"

namespace weave::core {

using namespace weave::v1;
using weave::observability::IntField;
using weave::observability::StringField;

TimeoutSweeper::TimeoutSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
                               std::shared_ptr<queue::TaskQueue> task_queue, std::shared_ptr<Orchestrator> orchestrator,
                               util::Millis interval)
    : repository_(std::move(repository)),
      event_log_(std::move(event_log)),
      task_queue_(std::move(task_queue)),
      orchestrator_(std::move(orchestrator)),
      interval_(interval) {
}

TimeoutSweeper::~TimeoutSweeper() {
  Stop();
}

void TimeoutSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&TimeoutSweeper::Run, this);
}

void TimeoutSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void TimeoutSweeper::Run() {
  while (running_) {
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      WEAVE_LOG_ERROR("timeout sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

SweepReport TimeoutSweeper::SweepOnce() {
  SweepReport report;
  report.runs_timed_out = SweepRuns();
  SweepActivities(report);
  return report;
}

size_t TimeoutSweeper::SweepRuns() {
  std::vector<db::model::RunRecord> expired;
  {
    auto tx = repository_->Begin();
    expired = repository_->ListExpiredRuns(*tx, util::NowMillis());
    tx->Commit();
  }

  size_t timed_out = 0;
  for (const auto& run : expired) {
    if (orchestrator_->TimeOut(run.run_id)) timed_out++;
  }
  return timed_out;
}

void TimeoutSweeper::SweepActivities(SweepReport& report) {
  std::vector<db::model::TaskRecord> tasks;
  {
    auto tx = repository_->Begin();
    tasks   = repository_->ListTasksByKind(*tx, TASK_KIND_ACTIVITY);
    tx->Commit();
  }

  const util::TimePoint           now = util::Now();
  std::unordered_set<std::string> lapsed_now;

  for (const auto& task : tasks) {
    TaskPayload payload;
    if (!payload.ParseFromString(task.payload) || !payload.has_activity()) {
      WEAVE_LOG_WARN("skipping unreadable activity task", {StringField("queue", task.queue_name), StringField("task_id", task.task_id)});
      continue;
    }
    const auto& activity = payload.activity();
    const auto  timeouts = retry::ActivityTimeouts::FromProto(activity.timeouts());

    std::string reason;
    if (timeouts.schedule_to_close.count() > 0 && activity.has_first_scheduled_time() &&
        now >= util::FromProto(activity.first_scheduled_time()) + timeouts.schedule_to_close) {
      reason = "schedule-to-close timeout exceeded";
    } else if (!task.lease_token.empty() && task.lease_started_at_ms > 0 && timeouts.start_to_close.count() > 0 &&
               now >= util::FromUnixMillis(task.lease_started_at_ms) + timeouts.start_to_close) {
      // live or lapsed: a lapsed attempt must not be redelivered with a fresh budget
      reason = "start-to-close timeout exceeded";
    }

    if (!reason.empty()) {
      try {
        if (TimeOutActivity(task, reason)) report.activities_timed_out++;
      } catch (const util::ConcurrencyConflict& e) {
        // the run moved on underneath us; the next pass looks again
        WEAVE_LOG_DEBUG("activity timeout deferred", {StringField("task_id", task.task_id), StringField("error", e.what())});
      }
      continue;
    }

    if (!task.lease_token.empty() && !task.IsLeased(util::ToUnixMillis(now))) {
      lapsed_now.insert(task.lease_token);
      if (reported_lapses_.count(task.lease_token) == 0) {
        report.lapsed_leases++;
        WEAVE_LOG_WARN("activity lease lapsed",
                       {StringField("run_id", task.run_id), StringField("activity_id", activity.activity_id()),
                        StringField("activity_type", activity.activity_type()), IntField("delivery", task.delivery_count)});
      }
    }
  }

  reported_lapses_ = std::move(lapsed_now);
}

bool TimeoutSweeper::TimeOutActivity(const db::model::TaskRecord& seen, const std::string& reason) {
  auto tx = repository_->Begin();

  auto current = repository_->GetTask(*tx, seen.queue_name, seen.task_id);
  if (!current.has_value() || current->lease_token != seen.lease_token || current->delivery_count != seen.delivery_count) {
    tx->Commit();
    return false;
  }

  TaskPayload payload;
  if (!payload.ParseFromString(current->payload)) {
    throw std::runtime_error("corrupt task payload: queue=" + current->queue_name + " task=" + current->task_id);
  }
  const auto& activity = payload.activity();

  auto run = repository_->GetRun(*tx, current->run_id);
  if (run.has_value() && run->status == WORKFLOW_STATUS_RUNNING) {
    auto  event = history::NewEvent(EVENT_TYPE_ACTIVITY_FAILED);
    auto* attrs = event.mutable_activity_failed();
    attrs->set_activity_id(activity.activity_id());
    attrs->set_attempt(activity.attempt());
    *attrs->mutable_failure() = history::MakeFailure(retry::kTimeoutCategory, reason);
    attrs->set_reason(reason);

    std::vector<HistoryEvent> events{std::move(event)};
    event_log_->Append(*tx, run->run_id, run->last_sequence, events);

    TaskPayload decision;
    decision.mutable_decision()->set_workflow_id(run->workflow_id);
    decision.mutable_decision()->set_run_id(run->run_id);
    task_queue_->Enqueue(*tx, queue::DecisionQueue(run->task_queue), decision);
  }

  db::ThrowIfDbError(repository_->DeleteTask(*tx, current->queue_name, current->task_id), "delete timed out activity task");
  tx->Commit();
  task_queue_->Notify();

  WEAVE_LOG_WARN("activity timed out", {StringField("run_id", current->run_id), StringField("activity_id", activity.activity_id()),
                                        IntField("attempt", activity.attempt()), StringField("reason", reason)});
  return true;
}

} // namespace weave::core
