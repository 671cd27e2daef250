#pragma once

#include <stdexcept>
#include <string>

namespace weave::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic append lost against another writer. Re-read history and retry.
class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The lease behind a task handle was lost (expired and re-issued, or the task is gone).
class WorkerLeaseExpired : public std::runtime_error {
 public:
  explicit WorkerLeaseExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Replay produced decisions that disagree with recorded history.
class NondeterminismDetected : public std::runtime_error {
 public:
  explicit NondeterminismDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend busy or I/O failure. Safe to retry.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised by activity handlers.

  The category is matched against RetryPolicy::non_retryable_categories;
  non_retryable short-circuits the policy.
*/
class ActivityFailure : public std::runtime_error {
 public:
  ActivityFailure(std::string category, const std::string& msg, bool non_retryable = false)
      : std::runtime_error(msg), category_(std::move(category)), non_retryable_(non_retryable) {
  }

  const std::string& Category() const {
    return category_;
  }

  bool NonRetryable() const {
    return non_retryable_;
  }

 private:
  std::string category_;
  bool        non_retryable_;
};

} // namespace weave::util
