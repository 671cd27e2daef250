#include "workflow_context.hpp"

#include "internal/util/errors.hpp"

namespace weave::workflow {

using namespace weave::v1;

namespace {

// FNV-1a; stable across platforms and standard library versions.
uint64_t SeedFor(const std::string& run_id) {
  uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : run_id) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace

const std::string& ActivityHandle::Get() const {
  if (state_ == State::kPending) throw WorkflowSuspended{};
  if (state_ == State::kFailed) throw ActivityError(failure_);
  return output_;
}

void TimerHandle::Wait() const {
  if (!fired_) throw WorkflowSuspended{};
}

WorkflowContext::WorkflowContext(std::string run_id, const std::vector<HistoryEvent>& history)
    : run_id_(std::move(run_id)), random_(SeedFor(run_id_)) {
  for (const auto& event : history) {
    switch (event.event_type()) {
      case EVENT_TYPE_WORKFLOW_STARTED: {
        const auto& attrs = event.workflow_started();
        workflow_id_      = attrs.workflow_id();
        workflow_type_    = attrs.workflow_type();
        input_            = attrs.input();
        logical_now_      = util::FromProto(event.event_time());
        break;
      }
      case EVENT_TYPE_ACTIVITY_SCHEDULED: {
        const auto& attrs = event.activity_scheduled();
        // retries reuse the activity id; only the first schedule is a call
        if (activities_.find(attrs.activity_id()) == activities_.end()) {
          recorded_.push_back({Recorded::Kind::kActivity, attrs.activity_id(), attrs.activity_type(), event.sequence()});
          activities_[attrs.activity_id()];
        }
        break;
      }
      case EVENT_TYPE_ACTIVITY_COMPLETED: {
        auto& outcome  = activities_[event.activity_completed().activity_id()];
        outcome.state  = ActivityHandle::State::kCompleted;
        outcome.output = event.activity_completed().output();
        break;
      }
      case EVENT_TYPE_ACTIVITY_FAILED: {
        auto& outcome   = activities_[event.activity_failed().activity_id()];
        outcome.state   = ActivityHandle::State::kFailed;
        outcome.failure = event.activity_failed().failure();
        break;
      }
      case EVENT_TYPE_TIMER_STARTED:
        recorded_.push_back({Recorded::Kind::kTimer, event.timer_started().timer_id(), "", event.sequence()});
        break;
      case EVENT_TYPE_TIMER_FIRED:
        fired_timers_[event.timer_fired().timer_id()] = util::FromProto(event.event_time());
        break;
      case EVENT_TYPE_WORKFLOW_CANCEL_REQUESTED:
        cancel_requested_ = true;
        cancel_reason_    = event.workflow_cancel_requested().reason();
        break;
      case EVENT_TYPE_WORKFLOW_SIGNALED:
        signals_[event.workflow_signaled().signal_name()].push_back(event.workflow_signaled().payload());
        break;
      default:
        break;
    }
  }
}

std::string WorkflowContext::NextId(const char* prefix) {
  return std::string(prefix) + std::to_string(next_id_++);
}

void WorkflowContext::CheckRecorded(Recorded::Kind kind, const std::string& id, const std::string& activity_type) {
  const auto& recorded = recorded_[call_index_];
  if (recorded.kind != kind || recorded.id != id || recorded.activity_type != activity_type) {
    const char* wanted = kind == Recorded::Kind::kActivity ? "activity" : "timer";
    throw util::NondeterminismDetected("run " + run_id_ + ": replay requested " + wanted + " " + id +
                                       (activity_type.empty() ? "" : " (" + activity_type + ")") + " but history event " +
                                       std::to_string(recorded.sequence) + " recorded " + recorded.id +
                                       (recorded.activity_type.empty() ? "" : " (" + recorded.activity_type + ")"));
  }
}

ActivityHandle WorkflowContext::ExecuteActivity(const std::string& activity_type, const std::string& input, ActivityOptions options) {
  if (activity_type.empty()) throw util::InvalidArgument("ExecuteActivity: activity type is required");

  ActivityHandle handle;
  handle.activity_id_ = NextId("activity-");

  if (call_index_ < recorded_.size()) {
    CheckRecorded(Recorded::Kind::kActivity, handle.activity_id_, activity_type);
    call_index_++;

    const auto& outcome = activities_.at(handle.activity_id_);
    handle.state_       = outcome.state;
    handle.output_      = outcome.output;
    handle.failure_     = outcome.failure;
    if (!handle.IsReady()) pending_++;
    return handle;
  }

  if (!close_.has_value()) {
    new_commands_.push_back(ScheduleActivityCommand{handle.activity_id_, activity_type, input, std::move(options)});
    pending_++;
  }
  return handle;
}

TimerHandle WorkflowContext::StartTimer(util::Millis fire_after) {
  TimerHandle handle;
  handle.timer_id_ = NextId("timer-");

  if (call_index_ < recorded_.size()) {
    CheckRecorded(Recorded::Kind::kTimer, handle.timer_id_, "");
    call_index_++;

    auto fired = fired_timers_.find(handle.timer_id_);
    if (fired != fired_timers_.end()) {
      handle.fired_ = true;
      if (fired->second > logical_now_) logical_now_ = fired->second;
    } else {
      pending_++;
    }
    return handle;
  }

  if (!close_.has_value()) {
    new_commands_.push_back(StartTimerCommand{handle.timer_id_, fire_after});
    pending_++;
  }
  return handle;
}

std::string WorkflowContext::WaitForSignal(const std::string& signal_name) {
  if (signal_name.empty()) throw util::InvalidArgument("WaitForSignal: signal name is required");

  auto&      consumed = signals_consumed_[signal_name];
  const auto received = signals_.find(signal_name);
  if (received == signals_.end() || consumed >= received->second.size()) {
    awaited_signal_ = signal_name;
    throw WorkflowSuspended{};
  }
  return received->second[consumed++];
}

uint64_t WorkflowContext::Random() {
  return random_();
}

void WorkflowContext::Complete(std::string result) {
  if (close_.has_value()) return;
  close_ = CompleteWorkflowCommand{std::move(result)};
}

void WorkflowContext::Fail(const std::string& category, const std::string& message) {
  if (close_.has_value()) return;
  FailWorkflowCommand fail;
  fail.failure.set_category(category);
  fail.failure.set_message(message);
  close_ = std::move(fail);
}

} // namespace weave::workflow
