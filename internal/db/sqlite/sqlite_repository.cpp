#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace weave::db::sqlite {

using weave::db::ErrorCode;
using weave::db::Result;

namespace {

/*
  Statement guard: finalizes on scope exit.
*/
class Stmt {
 public:
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw weave::util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Stmt() {
    sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  const int   n = sqlite3_column_bytes(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.run_id                = ColText(st, 0);
  r.workflow_id           = ColText(st, 1);
  r.workflow_type         = ColText(st, 2);
  r.task_queue            = ColText(st, 3);
  r.input                 = ColBlob(st, 4);
  r.status                = static_cast<weave::v1::WorkflowStatus>(ColI32(st, 5));
  r.last_sequence         = ColU64(st, 6);
  r.created_at_ms         = ColU64(st, 7);
  r.updated_at_ms         = ColU64(st, 8);
  r.closed_at_ms          = ColU64(st, 9);
  r.execution_deadline_ms = ColU64(st, 10);
  r.result                = ColBlob(st, 11);
  r.failure               = ColBlob(st, 12);
  return r;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.queue_name          = ColText(st, 0);
  r.task_id             = ColText(st, 1);
  r.kind                = static_cast<weave::v1::TaskKind>(ColI32(st, 2));
  r.run_id              = ColText(st, 3);
  r.workflow_id         = ColText(st, 4);
  r.payload             = ColBlob(st, 5);
  r.created_at_ms       = ColU64(st, 6);
  r.visible_at_ms       = ColU64(st, 7);
  r.delivery_count      = static_cast<uint32_t>(ColU64(st, 8));
  r.lease_token         = ColText(st, 9);
  r.lease_started_at_ms = ColU64(st, 10);
  r.heartbeat_at_ms     = ColU64(st, 11);
  r.heartbeat_details   = ColBlob(st, 12);
  return r;
}

// Binds the task columns after the key, in UPDATE_TASK order.
void BindTaskBody(sqlite3_stmt* st, int first, const model::TaskRecord& r) {
  BindI32(st, first + 0, static_cast<int>(r.kind));
  BindText(st, first + 1, r.run_id);
  BindText(st, first + 2, r.workflow_id);
  BindBlob(st, first + 3, r.payload);
  BindU64(st, first + 4, r.created_at_ms);
  BindU64(st, first + 5, r.visible_at_ms);
  BindU64(st, first + 6, r.delivery_count);
  BindText(st, first + 7, r.lease_token);
  BindU64(st, first + 8, r.lease_started_at_ms);
  BindU64(st, first + 9, r.heartbeat_at_ms);
  BindBlob(st, first + 10, r.heartbeat_details);
}

template <typename Record, typename Reader>
std::vector<Record> Collect(sqlite3_stmt* st, Reader read) {
  std::vector<Record> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db, sql::INSERT_RUN);

  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.workflow_id);
  BindText(st.get(), 3, r.workflow_type);
  BindText(st.get(), 4, r.task_queue);
  BindBlob(st.get(), 5, r.input);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindU64(st.get(), 7, r.last_sequence);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);
  BindU64(st.get(), 10, r.closed_at_ms);
  BindU64(st.get(), 11, r.execution_deadline_ms);
  BindBlob(st.get(), 12, r.result);
  BindBlob(st.get(), 13, r.failure);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& run_id) {
  Stmt st(TX(t).Handle(), sql::SELECT_RUN);
  BindText(st.get(), 1, run_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRun(st.get());
}

std::optional<model::RunRecord> SqliteRepository::GetLatestRun(Transaction& t, const std::string& workflow_id) {
  Stmt st(TX(t).Handle(), sql::SELECT_LATEST_RUN);
  BindText(st.get(), 1, workflow_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRun(st.get());
}

// BEGIN IMMEDIATE already holds the write lock
Result SqliteRepository::LockWorkflowId(Transaction&, const std::string&) {
  return Result::Ok();
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db, sql::UPDATE_RUN);

  BindText(st.get(), 1, r.workflow_id);
  BindText(st.get(), 2, r.workflow_type);
  BindText(st.get(), 3, r.task_queue);
  BindBlob(st.get(), 4, r.input);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindU64(st.get(), 6, r.last_sequence);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);
  BindU64(st.get(), 9, r.closed_at_ms);
  BindU64(st.get(), 10, r.execution_deadline_ms);
  BindBlob(st.get(), 11, r.result);
  BindBlob(st.get(), 12, r.failure);
  BindText(st.get(), 13, r.run_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "run not found: " + r.run_id);
  return Translate(db, rc);
}

std::vector<model::RunRecord> SqliteRepository::ListRunsByStatus(Transaction& t, weave::v1::WorkflowStatus status) {
  Stmt st(TX(t).Handle(), sql::SELECT_RUNS_BY_STATUS);
  BindI32(st.get(), 1, static_cast<int>(status));
  return Collect<model::RunRecord>(st.get(), ReadRun);
}

std::vector<model::RunRecord> SqliteRepository::ListExpiredRuns(Transaction& t, uint64_t now_ms) {
  Stmt st(TX(t).Handle(), sql::SELECT_EXPIRED_RUNS);
  BindI32(st.get(), 1, static_cast<int>(weave::v1::WORKFLOW_STATUS_RUNNING));
  BindU64(st.get(), 2, now_ms);
  return Collect<model::RunRecord>(st.get(), ReadRun);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvents(Transaction& t, const std::string& run_id, uint64_t expected_sequence,
                                      std::vector<model::EventRecord>& events) {
  auto*          db   = TX(t).Handle();
  const uint64_t last = LastEventSequence(t, run_id);
  if (last != expected_sequence) {
    return Result::Err(ErrorCode::Conflict,
                       "expected sequence " + std::to_string(expected_sequence) + " but log is at " + std::to_string(last));
  }

  Stmt     ins(db, sql::INSERT_EVENT);
  uint64_t next = last + 1;
  for (auto& e : events) {
    e.run_id   = run_id;
    e.sequence = next++;

    sqlite3_reset(ins.get());
    sqlite3_clear_bindings(ins.get());

    BindText(ins.get(), 1, e.run_id);
    BindU64(ins.get(), 2, e.sequence);
    BindI32(ins.get(), 3, e.event_type);
    BindU64(ins.get(), 4, e.event_time_ms);
    BindBlob(ins.get(), 5, e.data);

    int rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) {
      // (run_id, sequence) collision means another writer got there first
      if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::Conflict, sqlite3_errmsg(db));
      return Translate(db, rc);
    }
  }
  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t after_sequence,
                                                             uint64_t max_events) {
  Stmt st(TX(t).Handle(), sql::SELECT_EVENTS);
  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, after_sequence);
  BindU64(st.get(), 3, max_events);

  return Collect<model::EventRecord>(st.get(), [](sqlite3_stmt* row) {
    model::EventRecord e;
    e.run_id        = ColText(row, 0);
    e.sequence      = ColU64(row, 1);
    e.event_type    = ColI32(row, 2);
    e.event_time_ms = ColU64(row, 3);
    e.data          = ColBlob(row, 4);
    return e;
  });
}

uint64_t SqliteRepository::LastEventSequence(Transaction& t, const std::string& run_id) {
  Stmt st(TX(t).Handle(), sql::SELECT_LAST_SEQUENCE);
  BindText(st.get(), 1, run_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db, sql::INSERT_TASK);

  BindText(st.get(), 1, r.queue_name);
  BindText(st.get(), 2, r.task_id);
  BindTaskBody(st.get(), 3, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  Stmt st(TX(t).Handle(), sql::SELECT_TASK);
  BindText(st.get(), 1, queue_name);
  BindText(st.get(), 2, task_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTask(st.get());
}

std::optional<model::TaskRecord> SqliteRepository::LeaseNextTask(Transaction& t, const std::string& queue_name, uint64_t now_ms,
                                                                 uint64_t lease_until_ms, const std::string& lease_token) {
  std::optional<model::TaskRecord> task;
  {
    Stmt st(TX(t).Handle(), sql::SELECT_NEXT_VISIBLE_TASK);
    BindText(st.get(), 1, queue_name);
    BindU64(st.get(), 2, now_ms);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    task = ReadTask(st.get());
  }

  task->lease_token         = lease_token;
  task->lease_started_at_ms = now_ms;
  task->heartbeat_at_ms     = now_ms;
  task->visible_at_ms       = lease_until_ms;
  task->delivery_count++;

  auto res = UpdateTask(t, *task);
  if (!res) throw weave::util::StoreUnavailable("lease update failed: " + res.message);
  return task;
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db, sql::UPDATE_TASK);

  BindTaskBody(st.get(), 1, r);
  BindText(st.get(), 12, r.queue_name);
  BindText(st.get(), 13, r.task_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + r.task_id);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  auto* db = TX(t).Handle();
  Stmt  st(db, sql::DELETE_TASK);
  BindText(st.get(), 1, queue_name);
  BindText(st.get(), 2, task_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + task_id);
  return Translate(db, rc);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasks(Transaction& t, const std::string& queue_name) {
  Stmt st(TX(t).Handle(), sql::SELECT_TASKS_BY_QUEUE);
  BindText(st.get(), 1, queue_name);
  return Collect<model::TaskRecord>(st.get(), ReadTask);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksByKind(Transaction& t, weave::v1::TaskKind kind) {
  Stmt st(TX(t).Handle(), sql::SELECT_TASKS_BY_KIND);
  BindI32(st.get(), 1, static_cast<int>(kind));
  return Collect<model::TaskRecord>(st.get(), ReadTask);
}

std::vector<std::string> SqliteRepository::ListQueues(Transaction& t) {
  Stmt st(TX(t).Handle(), sql::SELECT_QUEUES);
  return Collect<std::string>(st.get(), [](sqlite3_stmt* row) { return ColText(row, 0); });
}

} // namespace weave::db::sqlite
