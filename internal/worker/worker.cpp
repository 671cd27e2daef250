#include "worker.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <variant>

#include "activity_context.hpp"
#include "internal/history/conflict_retry.hpp"
#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/replay.hpp"

namespace weave::worker {

using namespace weave::v1;
using weave::observability::IntField;
using weave::observability::StringField;

namespace {

constexpr const char* kNotRegisteredCategory = "ActivityNotRegistered";
constexpr const char* kApplicationCategory   = "ApplicationError";

struct FollowOn {
  std::string  queue_name;
  TaskPayload  payload;
  util::Millis delay{0};
};

FollowOn DecisionFollowOn(const std::string& task_queue, const std::string& workflow_id, const std::string& run_id) {
  FollowOn follow_on;
  follow_on.queue_name = queue::DecisionQueue(task_queue);
  follow_on.payload.mutable_decision()->set_workflow_id(workflow_id);
  follow_on.payload.mutable_decision()->set_run_id(run_id);
  return follow_on;
}

HistoryEvent WorkflowFailedEvent(const Failure& failure) {
  auto event                                         = history::NewEvent(EVENT_TYPE_WORKFLOW_FAILED);
  *event.mutable_workflow_failed()->mutable_failure() = failure;
  return event;
}

/*
  Turns replay commands into history events plus the tasks that carry
  them out. Policies and timeouts are resolved here, once, and recorded.
*/
void Translate(const std::vector<workflow::Command>& commands, const std::string& run_id, const WorkflowStartedAttributes& started,
               const workflow::ActivityRegistry& activities, std::vector<HistoryEvent>& events, std::vector<FollowOn>& follow_ons) {
  const auto now = util::ToProto(util::Now());

  for (const auto& command : commands) {
    if (const auto* schedule = std::get_if<workflow::ScheduleActivityCommand>(&command)) {
      auto  event = history::NewEvent(EVENT_TYPE_ACTIVITY_SCHEDULED);
      auto* attrs = event.mutable_activity_scheduled();
      attrs->set_activity_id(schedule->activity_id);
      attrs->set_activity_type(schedule->activity_type);
      attrs->set_input(schedule->input);
      attrs->set_attempt(1);
      attrs->set_task_queue(started.task_queue());
      *attrs->mutable_retry_policy()         = activities.ResolveRetryPolicy(schedule->activity_type, schedule->options.retry_policy);
      *attrs->mutable_timeouts()             = activities.ResolveTimeouts(schedule->activity_type, schedule->options.timeouts);
      *attrs->mutable_first_scheduled_time() = now;
      if ((schedule->options.retry_policy.has_value() || schedule->options.timeouts.has_value()) &&
          retry::IsUnbounded(retry::RetryPolicy::FromProto(attrs->retry_policy()), retry::ActivityTimeouts::FromProto(attrs->timeouts()))) {
        WEAVE_LOG_WARN("activity retries are unbounded: set maximum_attempts or a schedule-to-close timeout",
                       {StringField("workflow_id", started.workflow_id()), StringField("activity_type", schedule->activity_type)});
      }

      FollowOn follow_on;
      follow_on.queue_name = queue::ActivityQueue(started.task_queue());
      auto* task           = follow_on.payload.mutable_activity();
      task->set_workflow_id(started.workflow_id());
      task->set_run_id(run_id);
      task->set_activity_id(attrs->activity_id());
      task->set_activity_type(attrs->activity_type());
      task->set_input(attrs->input());
      task->set_attempt(1);
      *task->mutable_retry_policy()         = attrs->retry_policy();
      *task->mutable_timeouts()             = attrs->timeouts();
      *task->mutable_first_scheduled_time() = now;

      events.push_back(std::move(event));
      follow_ons.push_back(std::move(follow_on));
    } else if (const auto* timer = std::get_if<workflow::StartTimerCommand>(&command)) {
      auto event = history::NewEvent(EVENT_TYPE_TIMER_STARTED);
      event.mutable_timer_started()->set_timer_id(timer->timer_id);
      *event.mutable_timer_started()->mutable_fire_after() = util::ToProto(timer->fire_after);

      FollowOn follow_on;
      follow_on.queue_name = queue::DecisionQueue(started.task_queue());
      follow_on.delay      = timer->fire_after;
      follow_on.payload.mutable_timer()->set_workflow_id(started.workflow_id());
      follow_on.payload.mutable_timer()->set_run_id(run_id);
      follow_on.payload.mutable_timer()->set_timer_id(timer->timer_id);

      events.push_back(std::move(event));
      follow_ons.push_back(std::move(follow_on));
    } else if (const auto* complete = std::get_if<workflow::CompleteWorkflowCommand>(&command)) {
      auto event = history::NewEvent(EVENT_TYPE_WORKFLOW_COMPLETED);
      event.mutable_workflow_completed()->set_result(complete->result);
      events.push_back(std::move(event));
    } else if (const auto* fail = std::get_if<workflow::FailWorkflowCommand>(&command)) {
      events.push_back(WorkflowFailedEvent(fail->failure));
    }
  }
}

/*
  Keeps an activity lease alive while the handler runs.

  Extends the lease every `interval` (when non-zero) and serves the
  handler's explicit heartbeats. Once an extension is refused the lease
  is gone for good and Lost() stays true.
*/
class LeaseKeeper {
 public:
  LeaseKeeper(queue::TaskQueue& task_queue, queue::LeasedTask& task, util::Millis extension, util::Millis interval)
      : task_queue_(task_queue), task_(task), extension_(extension), interval_(interval) {
    if (interval_.count() > 0) thread_ = std::thread(&LeaseKeeper::Run, this);
  }

  ~LeaseKeeper() {
    {
      std::lock_guard lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  void Heartbeat(const std::string& details) {
    std::lock_guard lock(mutex_);
    if (lost_) throw util::WorkerLeaseExpired("heartbeat: lease on task " + task_.TaskId() + " was lost");
    try {
      task_queue_.Heartbeat(task_, extension_, details);
    } catch (const util::WorkerLeaseExpired&) {
      lost_ = true;
      throw;
    }
  }

  bool Lost() {
    std::lock_guard lock(mutex_);
    return lost_;
  }

 private:
  void Run() {
    std::unique_lock lock(mutex_);
    while (!cv_.wait_for(lock, interval_, [this] { return done_; })) {
      try {
        task_queue_.Heartbeat(task_, extension_);
      } catch (const util::WorkerLeaseExpired& e) {
        lost_ = true;
        WEAVE_LOG_WARN("activity lease lost", {StringField("task_id", task_.TaskId()), StringField("error", e.what())});
        return;
      } catch (const std::exception& e) {
        // transient; the lease survives until it actually lapses
        WEAVE_LOG_WARN("activity heartbeat failed", {StringField("task_id", task_.TaskId()), StringField("error", e.what())});
      }
    }
  }

  queue::TaskQueue&  task_queue_;
  queue::LeasedTask& task_;
  util::Millis       extension_;
  util::Millis       interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    done_ = false;
  bool                    lost_ = false;
  std::thread             thread_;
};

// a heartbeat timeout needs at least three extensions inside it
util::Millis KeeperInterval(util::Millis heartbeat_timeout, util::Millis configured) {
  if (heartbeat_timeout.count() <= 0) return configured;
  util::Millis derived = std::max(heartbeat_timeout / 3, util::Millis(1));
  return configured.count() > 0 ? std::min(configured, derived) : derived;
}

} // namespace

Worker::Worker(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
               std::shared_ptr<queue::TaskQueue> task_queue, std::shared_ptr<const workflow::WorkflowRegistry> workflows,
               std::shared_ptr<const workflow::ActivityRegistry> activities, WorkerOptions options)
    : repository_(std::move(repository)),
      event_log_(std::move(event_log)),
      task_queue_(std::move(task_queue)),
      workflows_(std::move(workflows)),
      activities_(std::move(activities)),
      options_(std::move(options)),
      decision_queue_(queue::DecisionQueue(options_.task_queue)),
      activity_queue_(queue::ActivityQueue(options_.task_queue)) {
}

Worker::~Worker() {
  Stop();
}

void Worker::Start() {
  if (running_.exchange(true)) return;

  for (uint32_t i = 0; i < options_.decision_pollers; ++i) {
    threads_.emplace_back(&Worker::PollLoop, this, TASK_KIND_DECISION);
  }
  for (uint32_t i = 0; i < options_.activity_pollers; ++i) {
    threads_.emplace_back(&Worker::PollLoop, this, TASK_KIND_ACTIVITY);
  }

  WEAVE_LOG_INFO("worker started", {StringField("task_queue", options_.task_queue), IntField("decision_pollers", options_.decision_pollers),
                                    IntField("activity_pollers", options_.activity_pollers)});
}

void Worker::Stop() {
  running_ = false;
  if (threads_.empty()) return;

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  WEAVE_LOG_INFO("worker stopped", {StringField("task_queue", options_.task_queue)});
}

bool Worker::RunDecisionOnce(util::Millis wait) {
  auto task = wait.count() > 0 ? task_queue_->Poll(decision_queue_, options_.decision_visibility_timeout, wait)
                               : task_queue_->Dequeue(decision_queue_, options_.decision_visibility_timeout);
  if (!task) return false;
  Dispatch(*task);
  return true;
}

bool Worker::RunActivityOnce(util::Millis wait) {
  auto task = wait.count() > 0 ? task_queue_->Poll(activity_queue_, options_.decision_visibility_timeout, wait)
                               : task_queue_->Dequeue(activity_queue_, options_.decision_visibility_timeout);
  if (!task) return false;
  Dispatch(*task);
  return true;
}

void Worker::PollLoop(TaskKind kind) {
  const std::string& queue_name = kind == TASK_KIND_DECISION ? decision_queue_ : activity_queue_;
  util::Millis       backoff    = options_.error_backoff;

  while (running_) {
    try {
      auto task = task_queue_->Poll(queue_name, options_.decision_visibility_timeout, options_.poll_wait);
      if (task) Dispatch(*task);
      backoff = options_.error_backoff;
    } catch (const util::WorkerLeaseExpired& e) {
      WEAVE_LOG_WARN("task lease lost, outcome discarded", {StringField("queue", queue_name), StringField("error", e.what())});
    } catch (const std::exception& e) {
      // the unacked task is redelivered once its lease lapses
      WEAVE_LOG_ERROR("task processing failed",
                      {StringField("queue", queue_name), StringField("error", e.what()), IntField("backoff_ms", backoff.count())});
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, options_.max_error_backoff);
    }
  }
}

void Worker::Dispatch(queue::LeasedTask& task) {
  switch (task.payload.body_case()) {
    case TaskPayload::kDecision:
      HandleDecision(task);
      break;
    case TaskPayload::kTimer:
      HandleTimer(task);
      break;
    case TaskPayload::kActivity:
      HandleActivity(task);
      break;
    default:
      WEAVE_LOG_WARN("dropping task without body", {StringField("queue", task.QueueName()), StringField("task_id", task.TaskId())});
      task_queue_->Ack(task);
      break;
  }
}

void Worker::HandleDecision(queue::LeasedTask& task) {
  const std::string run_id  = task.payload.decision().run_id();
  const auto        history = event_log_->ReadAll(run_id);

  if (history.empty()) {
    WEAVE_LOG_WARN("decision task for unknown run", {StringField("run_id", run_id)});
    task_queue_->Ack(task);
    return;
  }
  if (history::IsCloseEvent(history.back().event_type())) {
    task_queue_->Ack(task);
    return;
  }

  const auto& started = history.front().workflow_started();
  if (!workflows_->Contains(started.workflow_type())) {
    WEAVE_LOG_WARN("workflow type not registered", {StringField("workflow_type", started.workflow_type()), StringField("run_id", run_id)});
    task_queue_->Nack(task, options_.unknown_workflow_delay);
    return;
  }

  std::vector<HistoryEvent> events;
  std::vector<FollowOn>     follow_ons;
  try {
    auto definition = workflows_->Create(started.workflow_type());
    auto result     = workflow::Replay(*definition, run_id, history);
    Translate(result.commands, run_id, started, *activities_, events, follow_ons);
  } catch (const util::NondeterminismDetected& e) {
    WEAVE_LOG_ERROR("nondeterminism detected, failing run",
                    {StringField("workflow_id", started.workflow_id()), StringField("run_id", run_id), StringField("error", e.what())});
    events.clear();
    follow_ons.clear();
    events.push_back(WorkflowFailedEvent(history::MakeFailure(workflow::kNondeterminismCategory, e.what(), true)));
  } catch (const util::InvalidArgument& e) {
    WEAVE_LOG_WARN("invalid workflow command, failing run", {StringField("run_id", run_id), StringField("error", e.what())});
    events.clear();
    follow_ons.clear();
    events.push_back(WorkflowFailedEvent(history::MakeFailure(workflow::kWorkflowErrorCategory, e.what(), true)));
  }

  try {
    auto tx = repository_->Begin();
    task_queue_->Ack(*tx, task);
    event_log_->Append(*tx, run_id, history.size(), events);
    for (const auto& follow_on : follow_ons) {
      task_queue_->Enqueue(*tx, follow_on.queue_name, follow_on.payload, follow_on.delay);
    }
    tx->Commit();
  } catch (const util::ConcurrencyConflict& e) {
    // history moved while we replayed; redeliver and replay again
    WEAVE_LOG_DEBUG("decision lost append race", {StringField("run_id", run_id), StringField("error", e.what())});
    task_queue_->Nack(task);
    return;
  } catch (const util::InvalidState&) {
    // closed underneath us (terminated or timed out)
    task_queue_->Ack(task);
    return;
  }
  task_queue_->Notify();

  WEAVE_LOG_DEBUG("decision committed", {StringField("run_id", run_id), IntField("events", static_cast<int64_t>(events.size())),
                                         IntField("tasks", static_cast<int64_t>(follow_ons.size()))});
}

void Worker::HandleTimer(queue::LeasedTask& task) {
  const auto timer = task.payload.timer();

  history::RetryOnConflict("TimerFired", [&] {
    auto tx = repository_->Begin();
    task_queue_->Ack(*tx, task);

    auto run = repository_->GetRun(*tx, timer.run_id());
    if (run.has_value() && run->status == WORKFLOW_STATUS_RUNNING) {
      auto event = history::NewEvent(EVENT_TYPE_TIMER_FIRED);
      event.mutable_timer_fired()->set_timer_id(timer.timer_id());
      std::vector<HistoryEvent> events{std::move(event)};
      event_log_->Append(*tx, run->run_id, run->last_sequence, events);

      auto follow_on = DecisionFollowOn(run->task_queue, run->workflow_id, run->run_id);
      task_queue_->Enqueue(*tx, follow_on.queue_name, follow_on.payload);
    }
    tx->Commit();
  });
  task_queue_->Notify();
}

void Worker::HandleActivity(queue::LeasedTask& task) {
  const ActivityTask activity = task.payload.activity();
  const auto         policy   = retry::RetryPolicy::FromProto(activity.retry_policy());
  const auto         timeouts = retry::ActivityTimeouts::FromProto(activity.timeouts());

  {
    auto tx  = repository_->Begin();
    auto run = repository_->GetRun(*tx, activity.run_id());
    if (!run.has_value() || run->status != WORKFLOW_STATUS_RUNNING) {
      task_queue_->Ack(*tx, task);
      tx->Commit();
      return;
    }
    tx->Commit();
  }

  // the lease is the heartbeat grace when there is one, else the attempt budget plus slack
  util::Millis lease = timeouts.heartbeat.count() > 0 ? timeouts.heartbeat : timeouts.start_to_close + options_.start_to_close_grace;
  if (lease.count() <= 0) lease = options_.decision_visibility_timeout;
  const std::string previous_details = task.record.heartbeat_details;
  task_queue_->Heartbeat(task, lease);

  const util::TimePoint deadline = timeouts.start_to_close.count() > 0
                                       ? util::FromUnixMillis(task.record.lease_started_at_ms) + timeouts.start_to_close
                                       : util::TimePoint::max();

  std::optional<std::string> output;
  Failure                    failure;
  {
    LeaseKeeper     keeper(*task_queue_, task, lease, KeeperInterval(timeouts.heartbeat, options_.heartbeat_interval));
    ActivityContext ctx(activity, task.DeliveryCount(), deadline, previous_details,
                        [&keeper](const std::string& details) { keeper.Heartbeat(details); });

    auto registration = activities_->Find(activity.activity_type());
    if (!registration) {
      failure = history::MakeFailure(kNotRegisteredCategory, "activity type not registered: " + activity.activity_type());
    } else {
      try {
        output = registration->handler(ctx);
      } catch (const util::WorkerLeaseExpired&) {
        throw;
      } catch (const util::ActivityFailure& e) {
        failure = history::MakeFailure(e.Category(), e.what(), e.NonRetryable());
      } catch (const std::exception& e) {
        failure = history::MakeFailure(kApplicationCategory, e.what());
      }
    }

    if (keeper.Lost()) {
      throw util::WorkerLeaseExpired("activity " + activity.activity_id() + ": lease lost while running");
    }
  }

  if (util::Now() > deadline) {
    output.reset();
    failure = history::MakeFailure(retry::kTimeoutCategory, "start-to-close timeout exceeded");
  }

  const util::TimePoint first_scheduled =
      activity.has_first_scheduled_time() ? util::FromProto(activity.first_scheduled_time()) : util::Now();

  history::RetryOnConflict("ReportActivity", [&] {
    auto tx = repository_->Begin();
    task_queue_->Ack(*tx, task);

    auto run = repository_->GetRun(*tx, activity.run_id());
    if (!run.has_value() || run->status != WORKFLOW_STATUS_RUNNING) {
      tx->Commit();
      return;
    }

    std::vector<HistoryEvent> events;
    FollowOn                  follow_on = DecisionFollowOn(run->task_queue, run->workflow_id, run->run_id);

    if (output.has_value()) {
      auto event = history::NewEvent(EVENT_TYPE_ACTIVITY_COMPLETED);
      event.mutable_activity_completed()->set_activity_id(activity.activity_id());
      event.mutable_activity_completed()->set_attempt(activity.attempt());
      event.mutable_activity_completed()->set_output(*output);
      events.push_back(std::move(event));
    } else {
      const auto decision = retry::Classify(failure, activity.attempt(), policy, timeouts, first_scheduled, util::Now());
      if (decision.retry) {
        auto  event = history::NewEvent(EVENT_TYPE_ACTIVITY_SCHEDULED);
        auto* attrs = event.mutable_activity_scheduled();
        attrs->set_activity_id(activity.activity_id());
        attrs->set_activity_type(activity.activity_type());
        attrs->set_input(activity.input());
        attrs->set_attempt(activity.attempt() + 1);
        attrs->set_task_queue(run->task_queue);
        *attrs->mutable_retry_policy()         = activity.retry_policy();
        *attrs->mutable_timeouts()             = activity.timeouts();
        *attrs->mutable_first_scheduled_time() = util::ToProto(first_scheduled);
        *attrs->mutable_last_failure()         = failure;
        events.push_back(std::move(event));

        follow_on            = FollowOn{};
        follow_on.queue_name = queue::ActivityQueue(run->task_queue);
        follow_on.delay      = decision.backoff;
        auto* next           = follow_on.payload.mutable_activity();
        *next                = activity;
        next->set_attempt(activity.attempt() + 1);
        *next->mutable_first_scheduled_time() = util::ToProto(first_scheduled);
      } else {
        auto  event = history::NewEvent(EVENT_TYPE_ACTIVITY_FAILED);
        auto* attrs = event.mutable_activity_failed();
        attrs->set_activity_id(activity.activity_id());
        attrs->set_attempt(activity.attempt());
        *attrs->mutable_failure() = failure;
        attrs->set_reason(decision.reason);
        events.push_back(std::move(event));
      }
    }

    event_log_->Append(*tx, run->run_id, run->last_sequence, events);
    task_queue_->Enqueue(*tx, follow_on.queue_name, follow_on.payload, follow_on.delay);
    tx->Commit();
  });
  task_queue_->Notify();

  if (output.has_value()) {
    WEAVE_LOG_DEBUG("activity completed", {StringField("run_id", activity.run_id()), StringField("activity_id", activity.activity_id()),
                                           IntField("attempt", activity.attempt())});
  } else {
    WEAVE_LOG_INFO("activity attempt failed",
                   {StringField("run_id", activity.run_id()), StringField("activity_id", activity.activity_id()),
                    IntField("attempt", activity.attempt()), StringField("category", failure.category()),
                    StringField("error", failure.message())});
  }
}

} // namespace weave::worker
