#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "weave/v1/task.pb.h"

namespace weave::queue {

// Physical queue names for a logical task queue.
std::string DecisionQueue(const std::string& task_queue);
std::string ActivityQueue(const std::string& task_queue);

/*
  Handle to one delivery of a task.

  record.lease_token identifies the delivery; once the task is leased to
  someone else the handle is stale and Ack/Heartbeat throw
  WorkerLeaseExpired.
*/
struct LeasedTask {
  db::model::TaskRecord  record;
  weave::v1::TaskPayload payload;

  const std::string& QueueName() const {
    return record.queue_name;
  }
  const std::string& TaskId() const {
    return record.task_id;
  }
  uint32_t DeliveryCount() const {
    return record.delivery_count;
  }
};

struct QueueDepth {
  std::string queue_name;
  uint64_t    ready   = 0;
  uint64_t    leased  = 0;
  uint64_t    delayed = 0;
};

/*
  Durable named queues with visibility-timeout leases.

  Dequeue leases, Ack removes, Nack or lease lapse makes the task
  redeliverable with an incremented delivery count. FIFO is best effort
  (ordered by visible-at time). Every operation also exists in a
  transaction-scoped form so it can commit together with event appends;
  call Notify() after committing such a transaction to wake pollers.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::shared_ptr<db::Repository> repo, util::Millis poll_slice = util::Millis(50));

  std::string Enqueue(const std::string& queue_name, const weave::v1::TaskPayload& payload, util::Millis delay = util::Millis(0));
  std::string Enqueue(db::Transaction& tx, const std::string& queue_name, const weave::v1::TaskPayload& payload,
                      util::Millis delay = util::Millis(0));

  std::optional<LeasedTask> Dequeue(const std::string& queue_name, util::Millis visibility_timeout);
  std::optional<LeasedTask> Dequeue(db::Transaction& tx, const std::string& queue_name, util::Millis visibility_timeout);

  // Blocks up to `wait` for a task; returns nullopt on timeout or Shutdown().
  std::optional<LeasedTask> Poll(const std::string& queue_name, util::Millis visibility_timeout, util::Millis wait);

  void Ack(const LeasedTask& task);
  void Ack(db::Transaction& tx, const LeasedTask& task);

  void Nack(const LeasedTask& task, util::Millis delay = util::Millis(0));
  void Nack(db::Transaction& tx, const LeasedTask& task, util::Millis delay = util::Millis(0));

  // Extends the lease to now + extension and records heartbeat details.
  void Heartbeat(LeasedTask& task, util::Millis extension, const std::string& details = {});

  std::optional<QueueDepth> Depth(db::Transaction& tx, const std::string& queue_name);

  void Notify();
  void Shutdown();

  db::Repository& Repository() const {
    return *repo_;
  }

 private:
  db::model::TaskRecord CurrentLease(db::Transaction& tx, const LeasedTask& task, const char* op);

  std::shared_ptr<db::Repository> repo_;
  util::Millis                    poll_slice_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  uint64_t                generation_ = 0;
  bool                    shutdown_   = false;
};

} // namespace weave::queue
