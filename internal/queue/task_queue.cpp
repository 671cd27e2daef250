#include "task_queue.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/api/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace weave::queue {

using namespace weave::v1;

namespace {

void FillRouting(db::model::TaskRecord& record, const TaskPayload& payload) {
  switch (payload.body_case()) {
    case TaskPayload::kDecision:
      record.kind        = TASK_KIND_DECISION;
      record.run_id      = payload.decision().run_id();
      record.workflow_id = payload.decision().workflow_id();
      break;
    case TaskPayload::kActivity:
      record.kind        = TASK_KIND_ACTIVITY;
      record.run_id      = payload.activity().run_id();
      record.workflow_id = payload.activity().workflow_id();
      break;
    case TaskPayload::kTimer:
      record.kind        = TASK_KIND_TIMER;
      record.run_id      = payload.timer().run_id();
      record.workflow_id = payload.timer().workflow_id();
      break;
    default:
      throw util::InvalidArgument("enqueue: task payload has no body");
  }
}

} // namespace

std::string DecisionQueue(const std::string& task_queue) {
  return task_queue + ":decision";
}

std::string ActivityQueue(const std::string& task_queue) {
  return task_queue + ":activity";
}

TaskQueue::TaskQueue(std::shared_ptr<db::Repository> repo, util::Millis poll_slice) : repo_(std::move(repo)), poll_slice_(poll_slice) {
}

std::string TaskQueue::Enqueue(const std::string& queue_name, const TaskPayload& payload, util::Millis delay) {
  auto tx      = repo_->Begin();
  auto task_id = Enqueue(*tx, queue_name, payload, delay);
  tx->Commit();
  Notify();
  return task_id;
}

std::string TaskQueue::Enqueue(db::Transaction& tx, const std::string& queue_name, const TaskPayload& payload, util::Millis delay) {
  if (queue_name.empty()) throw util::InvalidArgument("enqueue: queue name is required");

  const uint64_t now = util::NowMillis();

  db::model::TaskRecord record;
  record.queue_name    = queue_name;
  record.task_id       = util::NewId();
  record.payload       = payload.SerializeAsString();
  record.created_at_ms = now;
  record.visible_at_ms = now + static_cast<uint64_t>(std::max<int64_t>(delay.count(), 0));
  FillRouting(record, payload);

  db::ThrowIfDbError(repo_->InsertTask(tx, record), "enqueue task");
  return record.task_id;
}

std::optional<LeasedTask> TaskQueue::Dequeue(const std::string& queue_name, util::Millis visibility_timeout) {
  auto tx   = repo_->Begin();
  auto task = Dequeue(*tx, queue_name, visibility_timeout);
  tx->Commit();
  return task;
}

std::optional<LeasedTask> TaskQueue::Dequeue(db::Transaction& tx, const std::string& queue_name, util::Millis visibility_timeout) {
  const uint64_t now    = util::NowMillis();
  auto           record = repo_->LeaseNextTask(tx, queue_name, now, now + static_cast<uint64_t>(visibility_timeout.count()), util::NewId());
  if (!record.has_value()) return std::nullopt;

  LeasedTask task;
  task.record = std::move(*record);
  if (!task.payload.ParseFromString(task.record.payload)) {
    throw std::runtime_error("corrupt task payload: queue=" + queue_name + " task=" + task.record.task_id);
  }
  return task;
}

std::optional<LeasedTask> TaskQueue::Poll(const std::string& queue_name, util::Millis visibility_timeout, util::Millis wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;

  for (;;) {
    uint64_t seen;
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return std::nullopt;
      seen = generation_;
    }

    if (auto task = Dequeue(queue_name, visibility_timeout)) return task;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return std::nullopt;

    // other processes sharing the store do not notify us, so never sleep
    // longer than one slice before looking again
    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, std::min(deadline, now + poll_slice_), [&] { return shutdown_ || generation_ != seen; });
  }
}

db::model::TaskRecord TaskQueue::CurrentLease(db::Transaction& tx, const LeasedTask& task, const char* op) {
  auto current = repo_->GetTask(tx, task.QueueName(), task.TaskId());
  if (!current.has_value()) {
    throw util::WorkerLeaseExpired(std::string(op) + ": task " + task.TaskId() + " no longer exists");
  }
  if (current->lease_token != task.record.lease_token) {
    throw util::WorkerLeaseExpired(std::string(op) + ": lease on task " + task.TaskId() + " was re-issued");
  }
  return *current;
}

void TaskQueue::Ack(const LeasedTask& task) {
  auto tx = repo_->Begin();
  Ack(*tx, task);
  tx->Commit();
}

void TaskQueue::Ack(db::Transaction& tx, const LeasedTask& task) {
  CurrentLease(tx, task, "ack");
  db::ThrowIfDbError(repo_->DeleteTask(tx, task.QueueName(), task.TaskId()), "ack task");
}

void TaskQueue::Nack(const LeasedTask& task, util::Millis delay) {
  auto tx = repo_->Begin();
  Nack(*tx, task, delay);
  tx->Commit();
  Notify();
}

void TaskQueue::Nack(db::Transaction& tx, const LeasedTask& task, util::Millis delay) {
  auto current          = CurrentLease(tx, task, "nack");
  current.lease_token   = "";
  current.visible_at_ms = util::NowMillis() + static_cast<uint64_t>(std::max<int64_t>(delay.count(), 0));
  db::ThrowIfDbError(repo_->UpdateTask(tx, current), "nack task");
}

void TaskQueue::Heartbeat(LeasedTask& task, util::Millis extension, const std::string& details) {
  auto tx      = repo_->Begin();
  auto current = CurrentLease(*tx, task, "heartbeat");

  const uint64_t now      = util::NowMillis();
  current.heartbeat_at_ms = now;
  current.visible_at_ms   = now + static_cast<uint64_t>(extension.count());
  if (!details.empty()) current.heartbeat_details = details;

  db::ThrowIfDbError(repo_->UpdateTask(*tx, current), "heartbeat task");
  tx->Commit();

  task.record = current;
}

std::optional<QueueDepth> TaskQueue::Depth(db::Transaction& tx, const std::string& queue_name) {
  auto tasks = repo_->ListTasks(tx, queue_name);
  if (tasks.empty()) return std::nullopt;

  const uint64_t now = util::NowMillis();
  QueueDepth     depth;
  depth.queue_name = queue_name;
  for (const auto& task : tasks) {
    if (task.visible_at_ms <= now) {
      depth.ready++;
    } else if (task.IsLeased(now)) {
      depth.leased++;
    } else {
      depth.delayed++;
    }
  }
  return depth;
}

void TaskQueue::Notify() {
  {
    std::lock_guard lock(mutex_);
    generation_++;
  }
  cv_.notify_all();
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace weave::queue
