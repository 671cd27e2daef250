#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace weave::retry {

RetryPolicy RetryPolicy::FromProto(const weave::v1::RetryPolicy& proto) {
  RetryPolicy p;
  if (proto.has_initial_interval()) p.initial_interval = util::FromProto(proto.initial_interval());
  if (proto.backoff_coefficient() != 0) p.backoff_coefficient = proto.backoff_coefficient();
  if (proto.has_maximum_interval()) p.maximum_interval = util::FromProto(proto.maximum_interval());
  p.maximum_attempts = proto.maximum_attempts();
  p.non_retryable_categories.assign(proto.non_retryable_categories().begin(), proto.non_retryable_categories().end());
  return p;
}

weave::v1::RetryPolicy RetryPolicy::ToProto() const {
  weave::v1::RetryPolicy proto;
  *proto.mutable_initial_interval() = util::ToProto(initial_interval);
  proto.set_backoff_coefficient(backoff_coefficient);
  *proto.mutable_maximum_interval() = util::ToProto(maximum_interval);
  proto.set_maximum_attempts(maximum_attempts);
  for (const auto& category : non_retryable_categories) {
    proto.add_non_retryable_categories(category);
  }
  return proto;
}

ActivityTimeouts ActivityTimeouts::FromProto(const weave::v1::ActivityTimeouts& proto) {
  ActivityTimeouts t;
  t.schedule_to_close = util::FromProto(proto.schedule_to_close());
  t.start_to_close    = util::FromProto(proto.start_to_close());
  t.heartbeat         = util::FromProto(proto.heartbeat());
  return t;
}

weave::v1::ActivityTimeouts ActivityTimeouts::ToProto() const {
  weave::v1::ActivityTimeouts proto;
  *proto.mutable_schedule_to_close() = util::ToProto(schedule_to_close);
  *proto.mutable_start_to_close()    = util::ToProto(start_to_close);
  *proto.mutable_heartbeat()         = util::ToProto(heartbeat);
  return proto;
}

weave::v1::RetryPolicy DefaultRetryPolicy() {
  return RetryPolicy{}.ToProto();
}

weave::v1::ActivityTimeouts DefaultActivityTimeouts() {
  ActivityTimeouts timeouts;
  timeouts.start_to_close = util::Millis(60000);
  return timeouts.ToProto();
}

util::Millis NextBackoff(uint32_t attempt, const RetryPolicy& policy) {
  const double exponent = attempt <= 1 ? 0.0 : static_cast<double>(attempt - 1);
  const double initial  = static_cast<double>(policy.initial_interval.count());
  const double maximum  = static_cast<double>(policy.maximum_interval.count());

  // pow() overflows to inf for large attempts; min() still caps it
  const double backoff = std::min(initial * std::pow(policy.backoff_coefficient, exponent), maximum);
  return util::Millis(static_cast<int64_t>(backoff));
}

bool ShouldRetry(uint32_t attempt, const std::string& category, const RetryPolicy& policy) {
  if (policy.maximum_attempts != 0 && attempt >= policy.maximum_attempts) return false;

  const auto& blocked = policy.non_retryable_categories;
  return std::find(blocked.begin(), blocked.end(), category) == blocked.end();
}

void Validate(const RetryPolicy& policy) {
  if (policy.initial_interval.count() <= 0) {
    throw util::InvalidArgument("retry policy: initial_interval must be positive");
  }
  if (policy.backoff_coefficient < 1.0) {
    throw util::InvalidArgument("retry policy: backoff_coefficient must be >= 1");
  }
  if (policy.maximum_interval < policy.initial_interval) {
    throw util::InvalidArgument("retry policy: maximum_interval must be >= initial_interval");
  }
}

void Validate(const ActivityTimeouts& timeouts) {
  if (timeouts.schedule_to_close.count() < 0 || timeouts.start_to_close.count() < 0 || timeouts.heartbeat.count() < 0) {
    throw util::InvalidArgument("activity timeouts must not be negative");
  }
  if (timeouts.schedule_to_close.count() == 0 && timeouts.start_to_close.count() == 0) {
    throw util::InvalidArgument("activity timeouts: one of schedule_to_close or start_to_close is required");
  }
}

namespace {

bool IsSet(const google::protobuf::Duration& d) {
  return d.seconds() != 0 || d.nanos() != 0;
}

} // namespace

// zero values count as unset
weave::v1::RetryPolicy Merge(const weave::v1::RetryPolicy& requested, const weave::v1::RetryPolicy& fallback) {
  weave::v1::RetryPolicy out = fallback;
  if (IsSet(requested.initial_interval())) *out.mutable_initial_interval() = requested.initial_interval();
  if (requested.backoff_coefficient() != 0) out.set_backoff_coefficient(requested.backoff_coefficient());
  if (IsSet(requested.maximum_interval())) *out.mutable_maximum_interval() = requested.maximum_interval();
  if (requested.has_maximum_attempts()) out.set_maximum_attempts(requested.maximum_attempts());
  if (requested.non_retryable_categories_size() > 0) {
    *out.mutable_non_retryable_categories() = requested.non_retryable_categories();
  }
  return out;
}

bool IsUnbounded(const RetryPolicy& policy, const ActivityTimeouts& timeouts) {
  return policy.maximum_attempts == 0 && timeouts.schedule_to_close.count() <= 0;
}

weave::v1::ActivityTimeouts Merge(const weave::v1::ActivityTimeouts& requested, const weave::v1::ActivityTimeouts& fallback) {
  weave::v1::ActivityTimeouts out = fallback;
  if (IsSet(requested.schedule_to_close())) *out.mutable_schedule_to_close() = requested.schedule_to_close();
  if (IsSet(requested.start_to_close())) *out.mutable_start_to_close() = requested.start_to_close();
  if (IsSet(requested.heartbeat())) *out.mutable_heartbeat() = requested.heartbeat();
  return out;
}

RetryDecision Classify(const weave::v1::Failure& failure, uint32_t attempt, const RetryPolicy& policy, const ActivityTimeouts& timeouts,
                       util::TimePoint first_scheduled, util::TimePoint now) {
  RetryDecision decision;

  if (failure.category() == kTimeoutCategory) {
    decision.reason = "timeout";
    return decision;
  }
  if (failure.non_retryable()) {
    decision.reason = "non-retryable failure";
    return decision;
  }
  if (!ShouldRetry(attempt, failure.category(), policy)) {
    decision.reason = policy.maximum_attempts != 0 && attempt >= policy.maximum_attempts ? "maximum attempts reached"
                                                                                          : "non-retryable category";
    return decision;
  }

  const auto backoff = NextBackoff(attempt, policy);
  if (timeouts.schedule_to_close.count() > 0 && now + backoff > first_scheduled + timeouts.schedule_to_close) {
    decision.reason = "schedule-to-close exceeded";
    return decision;
  }

  decision.retry   = true;
  decision.backoff = backoff;
  return decision;
}

} // namespace weave::retry
