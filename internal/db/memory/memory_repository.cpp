#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace weave::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.run_id)) return Result::Err(ErrorCode::AlreadyExists, "run exists: " + r.run_id);
  s.runs[r.run_id] = r;
  s.runs_by_workflow[r.workflow_id].push_back(r.run_id);
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(run_id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RunRecord> MemoryRepository::GetLatestRun(Transaction& t, const std::string& workflow_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs_by_workflow.find(workflow_id);
  if (it == s.runs_by_workflow.end() || it->second.empty()) return std::nullopt;
  return s.runs.at(it->second.back());
}

// transactions already run one at a time
Result MemoryRepository::LockWorkflowId(Transaction&, const std::string&) {
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.runs.find(r.run_id);
  if (it == s.runs.end()) return Result::Err(ErrorCode::NotFound, "run not found: " + r.run_id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::RunRecord> MemoryRepository::ListRunsByStatus(Transaction& t, weave::v1::WorkflowStatus status) {
  std::vector<model::RunRecord> out;
  for (const auto& [_, run] : TX(t).View().runs) {
    if (run.status == status) out.push_back(run);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

std::vector<model::RunRecord> MemoryRepository::ListExpiredRuns(Transaction& t, uint64_t now_ms) {
  std::vector<model::RunRecord> out;
  for (const auto& [_, run] : TX(t).View().runs) {
    if (run.status == weave::v1::WORKFLOW_STATUS_RUNNING && run.execution_deadline_ms != 0 && run.execution_deadline_ms <= now_ms) {
      out.push_back(run);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvents(Transaction& t, const std::string& run_id, uint64_t expected_sequence,
                                      std::vector<model::EventRecord>& events) {
  auto&          s       = TX(t).Mutable();
  auto&          history = s.events[run_id];
  const uint64_t last    = history.empty() ? 0 : history.back().sequence;
  if (last != expected_sequence) {
    return Result::Err(ErrorCode::Conflict,
                       "expected sequence " + std::to_string(expected_sequence) + " but log is at " + std::to_string(last));
  }

  uint64_t next = last + 1;
  for (auto& e : events) {
    e.run_id   = run_id;
    e.sequence = next++;
    history.push_back(e);
  }
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t after_sequence,
                                                             uint64_t max_events) {
  std::vector<model::EventRecord> out;
  const auto&                     s  = TX(t).View();
  auto                            it = s.events.find(run_id);
  if (it == s.events.end()) return out;

  // sequences are dense and 1-based
  for (size_t i = after_sequence; i < it->second.size() && out.size() < max_events; ++i) {
    out.push_back(it->second[i]);
  }
  return out;
}

uint64_t MemoryRepository::LastEventSequence(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(run_id);
  if (it == s.events.end() || it->second.empty()) return 0;
  return it->second.back().sequence;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  auto& q = s.queues[r.queue_name];
  if (q.tasks.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.task_id);

  const uint64_t order = s.next_insertion++;
  q.tasks[r.task_id]           = r;
  q.insertion_order[r.task_id] = order;
  q.by_visible_at.emplace(r.visible_at_ms, order, r.task_id);
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  const auto& s  = TX(t).View();
  auto        qi = s.queues.find(queue_name);
  if (qi == s.queues.end()) return std::nullopt;
  auto it = qi->second.tasks.find(task_id);
  if (it == qi->second.tasks.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TaskRecord> MemoryRepository::LeaseNextTask(Transaction& t, const std::string& queue_name, uint64_t now_ms,
                                                                 uint64_t lease_until_ms, const std::string& lease_token) {
  auto& s  = TX(t).Mutable();
  auto  qi = s.queues.find(queue_name);
  if (qi == s.queues.end()) return std::nullopt;

  auto& q = qi->second;
  if (q.by_visible_at.empty()) return std::nullopt;

  auto head = q.by_visible_at.begin();
  if (std::get<0>(*head) > now_ms) return std::nullopt;

  const auto [visible_at, order, task_id] = *head;
  q.by_visible_at.erase(head);

  auto& task               = q.tasks.at(task_id);
  task.lease_token         = lease_token;
  task.lease_started_at_ms = now_ms;
  task.heartbeat_at_ms     = now_ms;
  task.visible_at_ms       = lease_until_ms;
  task.delivery_count++;

  q.by_visible_at.emplace(task.visible_at_ms, order, task_id);
  return task;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  qi = s.queues.find(r.queue_name);
  if (qi == s.queues.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + r.task_id);

  auto& q  = qi->second;
  auto  it = q.tasks.find(r.task_id);
  if (it == q.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + r.task_id);

  const uint64_t order = q.insertion_order.at(r.task_id);
  q.by_visible_at.erase({it->second.visible_at_ms, order, r.task_id});
  it->second = r;
  q.by_visible_at.emplace(r.visible_at_ms, order, r.task_id);
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  auto& s  = TX(t).Mutable();
  auto  qi = s.queues.find(queue_name);
  if (qi == s.queues.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + task_id);

  auto& q  = qi->second;
  auto  it = q.tasks.find(task_id);
  if (it == q.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + task_id);

  q.by_visible_at.erase({it->second.visible_at_ms, q.insertion_order.at(task_id), task_id});
  q.insertion_order.erase(task_id);
  q.tasks.erase(it);
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t, const std::string& queue_name) {
  std::vector<model::TaskRecord> out;
  const auto&                    s  = TX(t).View();
  auto                           qi = s.queues.find(queue_name);
  if (qi == s.queues.end()) return out;

  for (const auto& [visible_at, order, task_id] : qi->second.by_visible_at) {
    out.push_back(qi->second.tasks.at(task_id));
  }
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksByKind(Transaction& t, weave::v1::TaskKind kind) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, q] : TX(t).View().queues) {
    for (const auto& [visible_at, order, task_id] : q.by_visible_at) {
      const auto& task = q.tasks.at(task_id);
      if (task.kind == kind) out.push_back(task);
    }
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListQueues(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [name, q] : TX(t).View().queues) {
    if (!q.tasks.empty()) out.push_back(name);
  }
  return out;
}

} // namespace weave::db::memory
