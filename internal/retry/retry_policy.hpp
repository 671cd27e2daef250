#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "weave/v1/common.pb.h"

namespace weave::retry {

// Failure category recorded when start-to-close or schedule-to-close lapses.
inline constexpr const char* kTimeoutCategory = "Timeout";

/*
  Resolved retry policy.

  Resolved once when an activity is scheduled and recorded in the
  ActivityScheduled event; every later attempt reads it from history.
*/
struct RetryPolicy {
  util::Millis             initial_interval{1000};
  double                   backoff_coefficient = 2.0;
  util::Millis             maximum_interval{100000};
  uint32_t                 maximum_attempts = 0; // 0 = unlimited
  std::vector<std::string> non_retryable_categories;

  static RetryPolicy FromProto(const weave::v1::RetryPolicy& proto);
  weave::v1::RetryPolicy ToProto() const;
};

struct ActivityTimeouts {
  util::Millis schedule_to_close{0}; // 0 = unbounded
  util::Millis start_to_close{0};
  util::Millis heartbeat{0};

  static ActivityTimeouts FromProto(const weave::v1::ActivityTimeouts& proto);
  weave::v1::ActivityTimeouts ToProto() const;
};

// Engine fallbacks: 1s initial, coefficient 2, 100s cap, unlimited attempts; 60s start-to-close.
weave::v1::RetryPolicy      DefaultRetryPolicy();
weave::v1::ActivityTimeouts DefaultActivityTimeouts();

// min(initial * coefficient^(attempt-1), maximum)
util::Millis NextBackoff(uint32_t attempt, const RetryPolicy& policy);

bool ShouldRetry(uint32_t attempt, const std::string& category, const RetryPolicy& policy);

// Throw util::InvalidArgument on a malformed policy.
void Validate(const RetryPolicy& policy);
void Validate(const ActivityTimeouts& timeouts);

// Field-wise merge: set fields of `requested` win over `fallback`. An explicit
// maximum_attempts of 0 requests unlimited attempts.
weave::v1::RetryPolicy Merge(const weave::v1::RetryPolicy& requested, const weave::v1::RetryPolicy& fallback);
weave::v1::ActivityTimeouts Merge(const weave::v1::ActivityTimeouts& requested, const weave::v1::ActivityTimeouts& fallback);

// Unlimited attempts with no schedule-to-close: a failing activity retries forever.
bool IsUnbounded(const RetryPolicy& policy, const ActivityTimeouts& timeouts);

struct RetryDecision {
  bool         retry = false;
  util::Millis backoff{0};
  std::string  reason; // why the failure is terminal
};

/*
  Decides what happens after a failed attempt.

  Terminal when the failure is a timeout, is flagged non-retryable, is in a
  non-retryable category, exhausts maximum_attempts, or when the next
  attempt would start past the schedule-to-close deadline.
*/
RetryDecision Classify(const weave::v1::Failure& failure, uint32_t attempt, const RetryPolicy& policy, const ActivityTimeouts& timeouts,
                       util::TimePoint first_scheduled, util::TimePoint now);

} // namespace weave::retry
