#include "events.hpp"

#include "internal/util/time.hpp"

namespace weave::history {

using namespace weave::v1;

HistoryEvent NewEvent(EventType type) {
  HistoryEvent event;
  event.set_event_type(type);
  *event.mutable_event_time() = util::ToProto(util::Now());
  return event;
}

bool IsCloseEvent(EventType type) {
  switch (type) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
    case EVENT_TYPE_WORKFLOW_FAILED:
    case EVENT_TYPE_WORKFLOW_TERMINATED:
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      return true;
    default:
      return false;
  }
}

WorkflowStatus StatusAfter(EventType type) {
  switch (type) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      return WORKFLOW_STATUS_COMPLETED;
    case EVENT_TYPE_WORKFLOW_FAILED:
      return WORKFLOW_STATUS_FAILED;
    case EVENT_TYPE_WORKFLOW_TERMINATED:
      return WORKFLOW_STATUS_TERMINATED;
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      return WORKFLOW_STATUS_TIMED_OUT;
    default:
      return WORKFLOW_STATUS_RUNNING;
  }
}

const char* EventTypeName(EventType type) {
  switch (type) {
    case EVENT_TYPE_WORKFLOW_STARTED:
      return "WorkflowStarted";
    case EVENT_TYPE_ACTIVITY_SCHEDULED:
      return "ActivityScheduled";
    case EVENT_TYPE_ACTIVITY_COMPLETED:
      return "ActivityCompleted";
    case EVENT_TYPE_ACTIVITY_FAILED:
      return "ActivityFailed";
    case EVENT_TYPE_TIMER_STARTED:
      return "TimerStarted";
    case EVENT_TYPE_TIMER_FIRED:
      return "TimerFired";
    case EVENT_TYPE_WORKFLOW_CANCEL_REQUESTED:
      return "WorkflowCancelRequested";
    case EVENT_TYPE_WORKFLOW_SIGNALED:
      return "WorkflowSignaled";
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      return "WorkflowCompleted";
    case EVENT_TYPE_WORKFLOW_FAILED:
      return "WorkflowFailed";
    case EVENT_TYPE_WORKFLOW_TERMINATED:
      return "WorkflowTerminated";
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      return "WorkflowTimedOut";
    default:
      return "Unspecified";
  }
}

Failure MakeFailure(const std::string& category, const std::string& message, bool non_retryable) {
  Failure failure;
  failure.set_category(category);
  failure.set_message(message);
  failure.set_non_retryable(non_retryable);
  return failure;
}

} // namespace weave::history
