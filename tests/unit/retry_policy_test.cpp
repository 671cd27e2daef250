#include "internal/retry/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using weave::retry::ActivityTimeouts;
using weave::retry::Classify;
using weave::retry::NextBackoff;
using weave::retry::RetryPolicy;
using weave::util::Millis;

weave::v1::Failure MakeFailure(const std::string& category, bool non_retryable = false) {
  weave::v1::Failure failure;
  failure.set_category(category);
  failure.set_message("boom");
  failure.set_non_retryable(non_retryable);
  return failure;
}

void TestBackoffGrowsAndCaps() {
  RetryPolicy policy;
  policy.initial_interval    = Millis(1000);
  policy.backoff_coefficient = 2.0;
  policy.maximum_interval    = Millis(30000);

  const std::vector<int64_t> expected = {1000, 2000, 4000, 8000, 16000, 30000, 30000};
  for (uint32_t attempt = 1; attempt <= expected.size(); ++attempt) {
    assert(NextBackoff(attempt, policy).count() == expected[attempt - 1]);
  }

  // far past overflow of the exponent, still capped
  assert(NextBackoff(5000, policy) == Millis(30000));
}

void TestShouldRetryHonorsAttemptsAndCategories() {
  RetryPolicy policy;
  policy.maximum_attempts         = 3;
  policy.non_retryable_categories = {"ValidationError"};

  assert(weave::retry::ShouldRetry(1, "IOError", policy));
  assert(weave::retry::ShouldRetry(2, "IOError", policy));
  assert(!weave::retry::ShouldRetry(3, "IOError", policy));
  assert(!weave::retry::ShouldRetry(1, "ValidationError", policy));

  policy.maximum_attempts = 0;
  assert(weave::retry::ShouldRetry(1000, "IOError", policy));
}

void TestClassifyTerminalCases() {
  RetryPolicy      policy;
  ActivityTimeouts timeouts;
  const auto       now = weave::util::Now();

  auto timeout = Classify(MakeFailure(weave::retry::kTimeoutCategory), 1, policy, timeouts, now, now);
  assert(!timeout.retry);

  auto flagged = Classify(MakeFailure("IOError", true), 1, policy, timeouts, now, now);
  assert(!flagged.retry);
  assert(flagged.reason == "non-retryable failure");

  policy.maximum_attempts = 2;
  auto exhausted          = Classify(MakeFailure("IOError"), 2, policy, timeouts, now, now);
  assert(!exhausted.retry);
  assert(exhausted.reason == "maximum attempts reached");

  policy.maximum_attempts = 0;
  auto retry              = Classify(MakeFailure("IOError"), 3, policy, timeouts, now, now);
  assert(retry.retry);
  assert(retry.backoff == Millis(4000));
}

void TestClassifyStopsAtScheduleToClose() {
  RetryPolicy      policy;
  ActivityTimeouts timeouts;
  timeouts.schedule_to_close = Millis(10000);

  const auto first = weave::util::Now();

  // 9s in, next backoff of 1s lands exactly on the deadline: still allowed
  auto on_edge = Classify(MakeFailure("IOError"), 1, policy, timeouts, first, first + Millis(9000));
  assert(on_edge.retry);

  // 9s in, next backoff of 2s would start past it
  auto past = Classify(MakeFailure("IOError"), 2, policy, timeouts, first, first + Millis(9000));
  assert(!past.retry);
  assert(past.reason == "schedule-to-close exceeded");
}

void TestValidateRejectsMalformedPolicies() {
  RetryPolicy policy;
  policy.backoff_coefficient = 0.5;

  bool threw = false;
  try {
    weave::retry::Validate(policy);
  } catch (const weave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  ActivityTimeouts none;
  threw = false;
  try {
    weave::retry::Validate(none);
  } catch (const weave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "at least one of schedule_to_close/start_to_close is required");
}

void TestMergePrefersRequestedFields() {
  weave::v1::RetryPolicy requested;
  requested.set_maximum_attempts(4);

  const auto merged = weave::retry::Merge(requested, weave::retry::DefaultRetryPolicy());
  assert(merged.maximum_attempts() == 4);
  assert(merged.backoff_coefficient() == 2.0);
  assert(weave::util::FromProto(merged.maximum_interval()) == Millis(100000));
}

void TestMergeKeepsExplicitUnlimitedAttempts() {
  weave::v1::RetryPolicy registered;
  registered.set_maximum_attempts(5);

  // unset defers to the registered value
  weave::v1::RetryPolicy unset;
  assert(weave::retry::Merge(unset, registered).maximum_attempts() == 5);

  // an explicit zero overrides it with unlimited
  weave::v1::RetryPolicy unlimited;
  unlimited.set_maximum_attempts(0);
  const auto merged = weave::retry::Merge(unlimited, registered);
  assert(merged.has_maximum_attempts());
  assert(merged.maximum_attempts() == 0);
  assert(RetryPolicy::FromProto(merged).maximum_attempts == 0);
}

void TestUnboundedRetriesDetected() {
  RetryPolicy      policy;
  ActivityTimeouts timeouts;
  timeouts.start_to_close = Millis(1000);
  assert(weave::retry::IsUnbounded(policy, timeouts));

  timeouts.schedule_to_close = Millis(60000);
  assert(!weave::retry::IsUnbounded(policy, timeouts));

  timeouts.schedule_to_close = Millis(0);
  policy.maximum_attempts    = 3;
  assert(!weave::retry::IsUnbounded(policy, timeouts));
}

} // namespace

int main() {
  TestBackoffGrowsAndCaps();
  TestShouldRetryHonorsAttemptsAndCategories();
  TestClassifyTerminalCases();
  TestClassifyStopsAtScheduleToClose();
  TestValidateRejectsMalformedPolicies();
  TestMergePrefersRequestedFields();
  TestMergeKeepsExplicitUnlimitedAttempts();
  TestUnboundedRetriesDetected();

  std::cout << "weave_unit_retry_policy: pass\n";
  return 0;
}
