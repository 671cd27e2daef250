#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/retry/retry_policy.hpp"
#include "workflow_definition.hpp"
#include "weave/v1/common.pb.h"

namespace weave::worker {
class ActivityContext;
}

namespace weave::workflow {

using WorkflowFactory = std::function<std::unique_ptr<WorkflowDefinition>()>;

/*
  Workflow type name -> definition factory.
*/
class WorkflowRegistry {
 public:
  void Register(const std::string& workflow_type, WorkflowFactory factory);

  template <typename Definition>
  void Register(const std::string& workflow_type) {
    Register(workflow_type, [] { return std::make_unique<Definition>(); });
  }

  bool Contains(const std::string& workflow_type) const;

  // Throws NotFound for an unknown type.
  std::unique_ptr<WorkflowDefinition> Create(const std::string& workflow_type) const;

  std::vector<std::string> Types() const;

 private:
  mutable std::mutex                               mutex_;
  std::unordered_map<std::string, WorkflowFactory> factories_;
};

// Returns the activity output; failures are reported by throwing
// util::ActivityFailure (or any std::exception).
using ActivityHandler = std::function<std::string(worker::ActivityContext&)>;

struct ActivityRegistration {
  std::string                 activity_type;
  ActivityHandler             handler;
  weave::v1::RetryPolicy      retry_policy; // resolved against engine defaults
  weave::v1::ActivityTimeouts timeouts;
};

/*
  Activity type name -> handler plus default retry policy and timeouts.

  Defaults given at registration are merged over the engine defaults and
  validated immediately, so a bad policy fails at startup rather than at
  the first failure.
*/
class ActivityRegistry {
 public:
  explicit ActivityRegistry(weave::v1::RetryPolicy      default_retry_policy = retry::DefaultRetryPolicy(),
                            weave::v1::ActivityTimeouts default_timeouts     = retry::DefaultActivityTimeouts());

  void Register(const std::string& activity_type, ActivityHandler handler, const weave::v1::RetryPolicy& retry_policy = {},
                const weave::v1::ActivityTimeouts& timeouts = {});

  bool Contains(const std::string& activity_type) const;

  // nullptr for an unknown type
  std::shared_ptr<const ActivityRegistration> Find(const std::string& activity_type) const;

  /*
    Policy and timeouts for a new schedule: per-call options over the
    registered defaults over the engine defaults. Throws InvalidArgument
    when the result is invalid.
  */
  weave::v1::RetryPolicy      ResolveRetryPolicy(const std::string& activity_type, const std::optional<weave::v1::RetryPolicy>& requested) const;
  weave::v1::ActivityTimeouts ResolveTimeouts(const std::string& activity_type,
                                              const std::optional<weave::v1::ActivityTimeouts>& requested) const;

 private:
  weave::v1::RetryPolicy      default_retry_policy_;
  weave::v1::ActivityTimeouts default_timeouts_;

  mutable std::mutex                                                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<const ActivityRegistration>> activities_;
};

} // namespace weave::workflow
