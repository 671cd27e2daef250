#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace weave::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - AppendEvents is a compare-and-append on the run's last sequence
  - LeaseNextTask never hands out a task whose lease is still active

  The DB is the source of truth for:
    workflow histories
    run projections
    queued tasks and their leases
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& run_id) = 0;

  // Most recently created run for the workflow id.
  virtual std::optional<model::RunRecord> GetLatestRun(Transaction&, const std::string& workflow_id) = 0;

  // Held until the transaction ends; a second transaction locking the same
  // workflow id waits for it, then sees its writes.
  virtual Result LockWorkflowId(Transaction&, const std::string& workflow_id) = 0;

  virtual Result UpdateRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::vector<model::RunRecord> ListRunsByStatus(Transaction&, weave::v1::WorkflowStatus status) = 0;

  // Running runs whose execution deadline is set and <= now_ms.
  virtual std::vector<model::RunRecord> ListExpiredRuns(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Appends events numbered expected_sequence+1, expected_sequence+2, ...
  // Returns Conflict if the run's last sequence is not expected_sequence.
  virtual Result AppendEvents(Transaction&, const std::string& run_id, uint64_t expected_sequence,
                              std::vector<model::EventRecord>& events) = 0;

  // Events with sequence > after_sequence in order, at most max_events.
  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t after_sequence,
                                                     uint64_t max_events) = 0;

  virtual uint64_t LastEventSequence(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& queue_name, const std::string& task_id) = 0;

  // Leases the earliest visible task (visible_at_ms <= now_ms): sets the
  // lease token, pushes visible_at_ms to lease_until_ms and bumps the
  // delivery count. Returns the updated record.
  virtual std::optional<model::TaskRecord> LeaseNextTask(Transaction&, const std::string& queue_name, uint64_t now_ms,
                                                         uint64_t lease_until_ms, const std::string& lease_token) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& queue_name, const std::string& task_id) = 0;

  virtual std::vector<model::TaskRecord> ListTasks(Transaction&, const std::string& queue_name) = 0;

  virtual std::vector<model::TaskRecord> ListTasksByKind(Transaction&, weave::v1::TaskKind kind) = 0;

  virtual std::vector<std::string> ListQueues(Transaction&) = 0;
};

} // namespace weave::db
