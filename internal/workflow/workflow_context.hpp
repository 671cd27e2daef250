#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "command.hpp"
#include "weave/v1/history.pb.h"

namespace weave::workflow {

class WorkflowContext;

// Unwinds Run() while it waits on an activity, a timer or a signal. Deliberately
// not a std::exception so workflow catch blocks do not intercept it.
struct WorkflowSuspended {};

/*
  Result slot of one ExecuteActivity call, resolved from history.
*/
class ActivityHandle {
 public:
  enum class State { kPending, kCompleted, kFailed };

  const std::string& ActivityId() const {
    return activity_id_;
  }
  State GetState() const {
    return state_;
  }
  bool IsReady() const {
    return state_ != State::kPending;
  }
  bool Succeeded() const {
    return state_ == State::kCompleted;
  }

  // Output of a completed activity. Suspends the workflow while pending and
  // throws ActivityError when the activity failed terminally.
  const std::string& Get() const;

  const weave::v1::Failure& Failure() const {
    return failure_;
  }

 private:
  friend class WorkflowContext;

  std::string        activity_id_;
  State              state_ = State::kPending;
  std::string        output_;
  weave::v1::Failure failure_;
};

class TimerHandle {
 public:
  const std::string& TimerId() const {
    return timer_id_;
  }
  bool Fired() const {
    return fired_;
  }

  // Suspends the workflow until the timer fires.
  void Wait() const;

 private:
  friend class WorkflowContext;

  std::string timer_id_;
  bool        fired_ = false;
};

/*
  Thrown by ActivityHandle::Get() for a terminally failed activity.
  Uncaught, it fails the workflow with the activity's failure.
*/
class ActivityError : public std::runtime_error {
 public:
  explicit ActivityError(weave::v1::Failure failure) : std::runtime_error(failure.message()), failure_(std::move(failure)) {
  }

  const weave::v1::Failure& Failure() const {
    return failure_;
  }

 private:
  weave::v1::Failure failure_;
};

/*
  Deterministic view of one run, handed to WorkflowDefinition::Run.

  Built from history by Replay. Every call is matched against the
  recorded history in call order: calls already recorded resolve from
  history, new calls become commands. Workflow code must use only these
  primitives for time, randomness and side effects.
*/
class WorkflowContext {
 public:
  WorkflowContext(std::string run_id, const std::vector<weave::v1::HistoryEvent>& history);

  const std::string& RunId() const {
    return run_id_;
  }
  const std::string& WorkflowId() const {
    return workflow_id_;
  }
  const std::string& WorkflowType() const {
    return workflow_type_;
  }
  const std::string& Input() const {
    return input_;
  }

  ActivityHandle ExecuteActivity(const std::string& activity_type, const std::string& input, ActivityOptions options = {});

  TimerHandle StartTimer(util::Millis fire_after);

  // Start time, advanced by every fired timer the workflow has observed.
  util::TimePoint Now() const {
    return logical_now_;
  }

  // Seeded from the run id; identical sequence on every replay.
  uint64_t Random();

  bool IsCancelRequested() const {
    return cancel_requested_;
  }
  const std::string& CancelReason() const {
    return cancel_reason_;
  }

  /*
    Payload of the next signal named `signal_name` not yet consumed by this
    run. Signals are consumed in arrival order; the workflow suspends until
    one is recorded.
  */
  std::string WaitForSignal(const std::string& signal_name);

  void Complete(std::string result);
  void Fail(const std::string& category, const std::string& message);

 private:
  friend class Replayer;

  struct Recorded {
    enum class Kind { kActivity, kTimer } kind;
    std::string id;
    std::string activity_type;
    uint64_t    sequence = 0;
  };

  struct ActivityOutcome {
    ActivityHandle::State state = ActivityHandle::State::kPending;
    std::string           output;
    weave::v1::Failure    failure;
  };

  std::string NextId(const char* prefix);
  void        CheckRecorded(Recorded::Kind kind, const std::string& id, const std::string& activity_type);

  std::string     run_id_;
  std::string     workflow_id_;
  std::string     workflow_type_;
  std::string     input_;
  util::TimePoint logical_now_{};
  std::mt19937_64 random_;

  bool        cancel_requested_ = false;
  std::string cancel_reason_;

  std::map<std::string, std::vector<std::string>> signals_;
  std::map<std::string, size_t>                   signals_consumed_;
  std::string                                     awaited_signal_;

  // schedules in history order, matched positionally against calls
  std::vector<Recorded>                  recorded_;
  std::map<std::string, ActivityOutcome> activities_;
  std::map<std::string, util::TimePoint> fired_timers_;

  size_t                 call_index_ = 0;
  uint64_t               next_id_    = 1;
  std::vector<Command>   new_commands_;
  std::optional<Command> close_;
  size_t                 pending_ = 0;
};

} // namespace weave::workflow
