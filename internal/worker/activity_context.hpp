#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/util/time.hpp"
#include "weave/v1/task.pb.h"

namespace weave::worker {

/*
  What an activity handler sees of its invocation.

  Heartbeat() extends the task lease and records progress details that a
  later delivery can read back through PreviousHeartbeatDetails(). It
  throws WorkerLeaseExpired once the lease is lost; the handler should
  stop, its result will be discarded anyway.
*/
class ActivityContext {
 public:
  using HeartbeatFn = std::function<void(const std::string& details)>;

  ActivityContext(weave::v1::ActivityTask task, uint32_t delivery, util::TimePoint deadline, std::string previous_details,
                  HeartbeatFn heartbeat);

  const std::string& WorkflowId() const {
    return task_.workflow_id();
  }
  const std::string& RunId() const {
    return task_.run_id();
  }
  const std::string& ActivityId() const {
    return task_.activity_id();
  }
  const std::string& ActivityType() const {
    return task_.activity_type();
  }
  const std::string& Input() const {
    return task_.input();
  }
  uint32_t Attempt() const {
    return task_.attempt();
  }

  // Delivery count of the underlying task; > 1 after a redelivery.
  uint32_t Delivery() const {
    return delivery_;
  }

  // Start-to-close deadline of this attempt (TimePoint::max() when unbounded).
  util::TimePoint Deadline() const {
    return deadline_;
  }
  bool IsDeadlineExceeded() const;

  const std::string& PreviousHeartbeatDetails() const {
    return previous_details_;
  }

  void Heartbeat(const std::string& details = {});

 private:
  weave::v1::ActivityTask task_;
  uint32_t                delivery_;
  util::TimePoint         deadline_;
  std::string             previous_details_;
  HeartbeatFn             heartbeat_;
};

} // namespace weave::worker
