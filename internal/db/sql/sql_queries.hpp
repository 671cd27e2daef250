#pragma once

namespace weave::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Column order here is the order the repository binds and reads.
*/

#define WEAVE_RUN_COLUMNS                                                                                                          \
  "run_id,workflow_id,workflow_type,task_queue,input,status,last_sequence,created_at_ms,updated_at_ms,closed_at_ms,"               \
  "execution_deadline_ms,result,failure"

#define WEAVE_TASK_COLUMNS                                                                                                         \
  "queue_name,task_id,kind,run_id,workflow_id,payload,created_at_ms,visible_at_ms,delivery_count,lease_token,lease_started_at_ms," \
  "heartbeat_at_ms,heartbeat_details"

// runs

static constexpr const char* INSERT_RUN = "INSERT INTO runs(" WEAVE_RUN_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RUN = "SELECT " WEAVE_RUN_COLUMNS " FROM runs WHERE run_id=?;";

static constexpr const char* SELECT_LATEST_RUN =
    "SELECT " WEAVE_RUN_COLUMNS " FROM runs WHERE workflow_id=? ORDER BY created_at_ms DESC, rowid DESC LIMIT 1;";

static constexpr const char* UPDATE_RUN =
    "UPDATE runs SET workflow_id=?,workflow_type=?,task_queue=?,input=?,status=?,last_sequence=?,created_at_ms=?,updated_at_ms=?,"
    "closed_at_ms=?,execution_deadline_ms=?,result=?,failure=? WHERE run_id=?;";

static constexpr const char* SELECT_RUNS_BY_STATUS =
    "SELECT " WEAVE_RUN_COLUMNS " FROM runs WHERE status=? ORDER BY created_at_ms ASC, rowid ASC;";

static constexpr const char* SELECT_EXPIRED_RUNS =
    "SELECT " WEAVE_RUN_COLUMNS " FROM runs WHERE status=? AND execution_deadline_ms<>0 AND execution_deadline_ms<=?;";

// events

static constexpr const char* SELECT_LAST_SEQUENCE = "SELECT COALESCE(MAX(sequence), 0) FROM events WHERE run_id=?;";

static constexpr const char* INSERT_EVENT = "INSERT INTO events(run_id,sequence,event_type,event_time_ms,data) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_EVENTS =
    "SELECT run_id,sequence,event_type,event_time_ms,data FROM events WHERE run_id=? AND sequence>? ORDER BY sequence ASC LIMIT ?;";

// tasks

static constexpr const char* INSERT_TASK = "INSERT INTO tasks(" WEAVE_TASK_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TASK = "SELECT " WEAVE_TASK_COLUMNS " FROM tasks WHERE queue_name=? AND task_id=?;";

static constexpr const char* SELECT_NEXT_VISIBLE_TASK =
    "SELECT " WEAVE_TASK_COLUMNS " FROM tasks WHERE queue_name=? AND visible_at_ms<=? ORDER BY visible_at_ms ASC, rowid ASC LIMIT 1;";

static constexpr const char* UPDATE_TASK =
    "UPDATE tasks SET kind=?,run_id=?,workflow_id=?,payload=?,created_at_ms=?,visible_at_ms=?,delivery_count=?,lease_token=?,"
    "lease_started_at_ms=?,heartbeat_at_ms=?,heartbeat_details=? WHERE queue_name=? AND task_id=?;";

static constexpr const char* DELETE_TASK = "DELETE FROM tasks WHERE queue_name=? AND task_id=?;";

static constexpr const char* SELECT_TASKS_BY_QUEUE =
    "SELECT " WEAVE_TASK_COLUMNS " FROM tasks WHERE queue_name=? ORDER BY visible_at_ms ASC, rowid ASC;";

static constexpr const char* SELECT_TASKS_BY_KIND =
    "SELECT " WEAVE_TASK_COLUMNS " FROM tasks WHERE kind=? ORDER BY queue_name ASC, visible_at_ms ASC, rowid ASC;";

static constexpr const char* SELECT_QUEUES = "SELECT DISTINCT queue_name FROM tasks ORDER BY queue_name ASC;";

} // namespace weave::db::sql
