#include "registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/errors.hpp"

namespace weave::workflow {

using weave::observability::StringField;

// ------------------------------------------------------------------
// WorkflowRegistry
// ------------------------------------------------------------------

void WorkflowRegistry::Register(const std::string& workflow_type, WorkflowFactory factory) {
  if (workflow_type.empty()) throw util::InvalidArgument("register workflow: type name is required");
  if (!factory) throw util::InvalidArgument("register workflow " + workflow_type + ": factory is required");

  std::lock_guard lock(mutex_);
  if (!factories_.emplace(workflow_type, std::move(factory)).second) {
    throw util::AlreadyExists("workflow type already registered: " + workflow_type);
  }
}

bool WorkflowRegistry::Contains(const std::string& workflow_type) const {
  std::lock_guard lock(mutex_);
  return factories_.contains(workflow_type);
}

std::unique_ptr<WorkflowDefinition> WorkflowRegistry::Create(const std::string& workflow_type) const {
  WorkflowFactory factory;
  {
    std::lock_guard lock(mutex_);
    auto            it = factories_.find(workflow_type);
    if (it == factories_.end()) throw util::NotFound("workflow type not registered: " + workflow_type);
    factory = it->second;
  }
  return factory();
}

std::vector<std::string> WorkflowRegistry::Types() const {
  std::vector<std::string> types;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [name, _] : factories_) types.push_back(name);
  }
  std::sort(types.begin(), types.end());
  return types;
}

// ------------------------------------------------------------------
// ActivityRegistry
// ------------------------------------------------------------------

ActivityRegistry::ActivityRegistry(weave::v1::RetryPolicy default_retry_policy, weave::v1::ActivityTimeouts default_timeouts)
    : default_retry_policy_(std::move(default_retry_policy)), default_timeouts_(std::move(default_timeouts)) {
}

void ActivityRegistry::Register(const std::string& activity_type, ActivityHandler handler, const weave::v1::RetryPolicy& retry_policy,
                                const weave::v1::ActivityTimeouts& timeouts) {
  if (activity_type.empty()) throw util::InvalidArgument("register activity: type name is required");
  if (!handler) throw util::InvalidArgument("register activity " + activity_type + ": handler is required");

  auto registration           = std::make_shared<ActivityRegistration>();
  registration->activity_type = activity_type;
  registration->handler       = std::move(handler);
  registration->retry_policy  = retry::Merge(retry_policy, default_retry_policy_);
  registration->timeouts      = retry::Merge(timeouts, default_timeouts_);

  const auto policy   = retry::RetryPolicy::FromProto(registration->retry_policy);
  const auto resolved = retry::ActivityTimeouts::FromProto(registration->timeouts);
  retry::Validate(policy);
  retry::Validate(resolved);
  if (retry::IsUnbounded(policy, resolved)) {
    WEAVE_LOG_WARN("activity retries are unbounded: set maximum_attempts or a schedule-to-close timeout",
                   {StringField("activity_type", activity_type)});
  }

  std::lock_guard lock(mutex_);
  if (!activities_.emplace(activity_type, std::move(registration)).second) {
    throw util::AlreadyExists("activity type already registered: " + activity_type);
  }
}

bool ActivityRegistry::Contains(const std::string& activity_type) const {
  std::lock_guard lock(mutex_);
  return activities_.contains(activity_type);
}

std::shared_ptr<const ActivityRegistration> ActivityRegistry::Find(const std::string& activity_type) const {
  std::lock_guard lock(mutex_);
  auto            it = activities_.find(activity_type);
  return it == activities_.end() ? nullptr : it->second;
}

weave::v1::RetryPolicy ActivityRegistry::ResolveRetryPolicy(const std::string&                           activity_type,
                                                            const std::optional<weave::v1::RetryPolicy>& requested) const {
  auto registration = Find(activity_type);
  auto base         = registration ? registration->retry_policy : default_retry_policy_;
  auto resolved     = requested.has_value() ? retry::Merge(*requested, base) : base;
  retry::Validate(retry::RetryPolicy::FromProto(resolved));
  return resolved;
}

weave::v1::ActivityTimeouts ActivityRegistry::ResolveTimeouts(const std::string&                                activity_type,
                                                              const std::optional<weave::v1::ActivityTimeouts>& requested) const {
  auto registration = Find(activity_type);
  auto base         = registration ? registration->timeouts : default_timeouts_;
  auto resolved     = requested.has_value() ? retry::Merge(*requested, base) : base;
  retry::Validate(retry::ActivityTimeouts::FromProto(resolved));
  return resolved;
}

} // namespace weave::workflow
