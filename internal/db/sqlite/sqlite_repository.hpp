#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace weave::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::optional<model::RunRecord> GetLatestRun(Transaction&, const std::string&) override;
  Result LockWorkflowId(Transaction&, const std::string&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  std::vector<model::RunRecord> ListRunsByStatus(Transaction&, weave::v1::WorkflowStatus) override;
  std::vector<model::RunRecord> ListExpiredRuns(Transaction&, uint64_t now_ms) override;

  Result AppendEvents(Transaction&, const std::string& run_id, uint64_t expected_sequence,
                      std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& run_id, uint64_t after_sequence,
                                             uint64_t max_events) override;
  uint64_t LastEventSequence(Transaction&, const std::string& run_id) override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& queue_name, const std::string& task_id) override;
  std::optional<model::TaskRecord> LeaseNextTask(Transaction&, const std::string& queue_name, uint64_t now_ms,
                                                 uint64_t lease_until_ms, const std::string& lease_token) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  Result DeleteTask(Transaction&, const std::string& queue_name, const std::string& task_id) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&, const std::string& queue_name) override;
  std::vector<model::TaskRecord> ListTasksByKind(Transaction&, weave::v1::TaskKind kind) override;
  std::vector<std::string> ListQueues(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
