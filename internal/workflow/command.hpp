#pragma once

#include <optional>
#include <string>
#include <variant>

#include "internal/util/time.hpp"
#include "weave/v1/common.pb.h"

namespace weave::workflow {

// Failure categories produced by the engine itself.
inline constexpr const char* kCanceledCategory       = "Canceled";
inline constexpr const char* kWorkflowErrorCategory  = "WorkflowError";
inline constexpr const char* kNondeterminismCategory = "Nondeterminism";

// Per-call overrides; unset fields fall back to the activity's registered defaults.
struct ActivityOptions {
  std::optional<weave::v1::RetryPolicy>      retry_policy;
  std::optional<weave::v1::ActivityTimeouts> timeouts;
};

struct ScheduleActivityCommand {
  std::string     activity_id;
  std::string     activity_type;
  std::string     input;
  ActivityOptions options;
};

struct StartTimerCommand {
  std::string  timer_id;
  util::Millis fire_after{0};
};

struct CompleteWorkflowCommand {
  std::string result;
};

struct FailWorkflowCommand {
  weave::v1::Failure failure;
};

using Command = std::variant<ScheduleActivityCommand, StartTimerCommand, CompleteWorkflowCommand, FailWorkflowCommand>;

} // namespace weave::workflow
