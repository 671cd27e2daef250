#include "pg_repository.hpp"

namespace weave::db::postgres {

namespace {

// Binary columns travel as hex text: encode()/decode() on the SQL side.
std::string ToHex(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return 0;
}

std::string FromHex(const pqxx::field& f) {
  if (f.is_null()) return {};
  std::string_view hex = f.view();
  std::string      out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>((HexValue(hex[i]) << 4) | HexValue(hex[i + 1])));
  }
  return out;
}

constexpr const char* kRunColumns =
    "run_id,workflow_id,workflow_type,task_queue,encode(input,'hex'),status,last_sequence,created_at_ms,updated_at_ms,"
    "closed_at_ms,execution_deadline_ms,encode(result,'hex'),encode(failure,'hex')";

constexpr const char* kTaskColumns =
    "queue_name,task_id,kind,run_id,workflow_id,encode(payload,'hex'),created_at_ms,visible_at_ms,delivery_count,lease_token,"
    "lease_started_at_ms,heartbeat_at_ms,encode(heartbeat_details,'hex')";

model::RunRecord ReadRun(const pqxx::row& row) {
  model::RunRecord r;
  r.run_id                = row[0].c_str();
  r.workflow_id           = row[1].c_str();
  r.workflow_type         = row[2].c_str();
  r.task_queue            = row[3].c_str();
  r.input                 = FromHex(row[4]);
  r.status                = static_cast<weave::v1::WorkflowStatus>(row[5].as<int>());
  r.last_sequence         = row[6].as<uint64_t>();
  r.created_at_ms         = row[7].as<uint64_t>();
  r.updated_at_ms         = row[8].as<uint64_t>();
  r.closed_at_ms          = row[9].as<uint64_t>();
  r.execution_deadline_ms = row[10].as<uint64_t>();
  r.result                = FromHex(row[11]);
  r.failure               = FromHex(row[12]);
  return r;
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.queue_name          = row[0].c_str();
  r.task_id             = row[1].c_str();
  r.kind                = static_cast<weave::v1::TaskKind>(row[2].as<int>());
  r.run_id              = row[3].c_str();
  r.workflow_id         = row[4].c_str();
  r.payload             = FromHex(row[5]);
  r.created_at_ms       = row[6].as<uint64_t>();
  r.visible_at_ms       = row[7].as<uint64_t>();
  r.delivery_count      = row[8].as<uint32_t>();
  r.lease_token         = row[9].c_str();
  r.lease_started_at_ms = row[10].as<uint64_t>();
  r.heartbeat_at_ms     = row[11].as<uint64_t>();
  r.heartbeat_details   = FromHex(row[12]);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> Collect(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result PgRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO runs(run_id,workflow_id,workflow_type,task_queue,input,status,last_sequence,created_at_ms,updated_at_ms,"
        "closed_at_ms,execution_deadline_ms,result,failure) "
        "VALUES($1,$2,$3,$4,decode($5,'hex'),$6,$7,$8,$9,$10,$11,decode($12,'hex'),decode($13,'hex'));",
        r.run_id, r.workflow_id, r.workflow_type, r.task_queue, ToHex(r.input), static_cast<int>(r.status), r.last_sequence, r.created_at_ms,
        r.updated_at_ms, r.closed_at_ms, r.execution_deadline_ms, ToHex(r.result), ToHex(r.failure));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RunRecord> PgRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns + " FROM runs WHERE run_id=$1;", run_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

Result PgRepository::LockWorkflowId(Transaction& t, const std::string& workflow_id) {
  try {
    TX(t).Work().exec_params("SELECT pg_advisory_xact_lock(hashtextextended($1, 0));", workflow_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RunRecord> PgRepository::GetLatestRun(Transaction& t, const std::string& workflow_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunColumns + " FROM runs WHERE workflow_id=$1 ORDER BY created_at_ms DESC, seq DESC LIMIT 1;", workflow_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

Result PgRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE runs SET workflow_id=$2,workflow_type=$3,task_queue=$4,input=decode($5,'hex'),status=$6,last_sequence=$7,"
        "created_at_ms=$8,updated_at_ms=$9,closed_at_ms=$10,execution_deadline_ms=$11,result=decode($12,'hex'),"
        "failure=decode($13,'hex') WHERE run_id=$1;",
        r.run_id, r.workflow_id, r.workflow_type, r.task_queue, ToHex(r.input), static_cast<int>(r.status), r.last_sequence, r.created_at_ms,
        r.updated_at_ms, r.closed_at_ms, r.execution_deadline_ms, ToHex(r.result), ToHex(r.failure));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "run not found: " + r.run_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RunRecord> PgRepository::ListRunsByStatus(Transaction& t, weave::v1::WorkflowStatus status) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunColumns + " FROM runs WHERE status=$1 ORDER BY created_at_ms ASC, seq ASC;", static_cast<int>(status));
  return Collect<model::RunRecord>(res, ReadRun);
}

std::vector<model::RunRecord> PgRepository::ListExpiredRuns(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns +
                                          " FROM runs WHERE status=$1 AND execution_deadline_ms<>0 AND execution_deadline_ms<=$2;",
                                      static_cast<int>(weave::v1::WORKFLOW_STATUS_RUNNING), now_ms);
  return Collect<model::RunRecord>(res, ReadRun);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::AppendEvents(Transaction& t, const std::string& run_id, uint64_t expected_sequence,
                                  std::vector<model::EventRecord>& events) {
  const uint64_t last = LastEventSequence(t, run_id);
  if (last != expected_sequence) {
    return Result::Err(ErrorCode::Conflict,
                       "expected sequence " + std::to_string(expected_sequence) + " but log is at " + std::to_string(last));
  }

  try {
    uint64_t next = last + 1;
    for (auto& e : events) {
      e.run_id   = run_id;
      e.sequence = next++;
      TX(t).Work().exec_prepared("insert_event", e.run_id, e.sequence, e.event_type, e.event_time_ms, ToHex(e.data));
    }
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // a concurrent writer claimed the sequence first
    return Result::Err(ErrorCode::Conflict, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& run_id, uint64_t after_sequence,
                                                         uint64_t max_events) {
  auto res = TX(t).Work().exec_prepared("select_events", run_id, after_sequence, max_events);
  return Collect<model::EventRecord>(res, [](const pqxx::row& row) {
    model::EventRecord e;
    e.run_id        = row[0].c_str();
    e.sequence      = row[1].as<uint64_t>();
    e.event_type    = row[2].as<int32_t>();
    e.event_time_ms = row[3].as<uint64_t>();
    e.data          = FromHex(row[4]);
    return e;
  });
}

uint64_t PgRepository::LastEventSequence(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_prepared("last_sequence", run_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tasks(queue_name,task_id,kind,run_id,workflow_id,payload,created_at_ms,visible_at_ms,delivery_count,lease_token,"
        "lease_started_at_ms,heartbeat_at_ms,heartbeat_details) "
        "VALUES($1,$2,$3,$4,$5,decode($6,'hex'),$7,$8,$9,$10,$11,$12,decode($13,'hex'));",
        r.queue_name, r.task_id, static_cast<int>(r.kind), r.run_id, r.workflow_id, ToHex(r.payload), r.created_at_ms, r.visible_at_ms,
        r.delivery_count, r.lease_token, r.lease_started_at_ms, r.heartbeat_at_ms, ToHex(r.heartbeat_details));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE queue_name=$1 AND task_id=$2;", queue_name,
                                      task_id);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

std::optional<model::TaskRecord> PgRepository::LeaseNextTask(Transaction& t, const std::string& queue_name, uint64_t now_ms,
                                                             uint64_t lease_until_ms, const std::string& lease_token) {
  auto picked = TX(t).Work().exec_prepared("next_visible_task", queue_name, now_ms);
  if (picked.empty()) return std::nullopt;

  const std::string task_id = picked[0][0].c_str();
  auto              res     = TX(t).Work().exec_params(std::string("UPDATE tasks SET lease_token=$3, lease_started_at_ms=$4, heartbeat_at_ms=$4, "
                                                                   "visible_at_ms=$5, delivery_count=delivery_count+1 "
                                                                   "WHERE queue_name=$1 AND task_id=$2 RETURNING ") +
                                                           kTaskColumns + ";",
                                                       queue_name, task_id, lease_token, now_ms, lease_until_ms);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

Result PgRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE tasks SET kind=$3,run_id=$4,workflow_id=$5,payload=decode($6,'hex'),created_at_ms=$7,visible_at_ms=$8,"
        "delivery_count=$9,lease_token=$10,lease_started_at_ms=$11,heartbeat_at_ms=$12,heartbeat_details=decode($13,'hex') "
        "WHERE queue_name=$1 AND task_id=$2;",
        r.queue_name, r.task_id, static_cast<int>(r.kind), r.run_id, r.workflow_id, ToHex(r.payload), r.created_at_ms, r.visible_at_ms,
        r.delivery_count, r.lease_token, r.lease_started_at_ms, r.heartbeat_at_ms, ToHex(r.heartbeat_details));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + r.task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteTask(Transaction& t, const std::string& queue_name, const std::string& task_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM tasks WHERE queue_name=$1 AND task_id=$2;", queue_name, task_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TaskRecord> PgRepository::ListTasks(Transaction& t, const std::string& queue_name) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE queue_name=$1 ORDER BY visible_at_ms ASC, seq ASC;", queue_name);
  return Collect<model::TaskRecord>(res, ReadTask);
}

std::vector<model::TaskRecord> PgRepository::ListTasksByKind(Transaction& t, weave::v1::TaskKind kind) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE kind=$1 ORDER BY queue_name ASC, visible_at_ms ASC, seq ASC;",
      static_cast<int>(kind));
  return Collect<model::TaskRecord>(res, ReadTask);
}

std::vector<std::string> PgRepository::ListQueues(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT DISTINCT queue_name FROM tasks ORDER BY queue_name ASC;");
  return Collect<std::string>(res, [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

} // namespace weave::db::postgres
