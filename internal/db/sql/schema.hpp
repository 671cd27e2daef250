#pragma once

#include <vector>

namespace weave::db::sql {

/*
  Bootstrap DDL per backend.

  Every statement is idempotent (IF NOT EXISTS) so it can run on each
  process start.
*/

inline const std::vector<const char*>& SqliteSchema() {
  static const std::vector<const char*> kSchema = {
      "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, workflow_id TEXT NOT NULL, workflow_type TEXT NOT NULL, task_queue TEXT NOT NULL, "
      "input BLOB, status INTEGER NOT NULL, last_sequence INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "closed_at_ms INTEGER NOT NULL DEFAULT 0, execution_deadline_ms INTEGER NOT NULL DEFAULT 0, result BLOB, failure BLOB);",
      "CREATE INDEX IF NOT EXISTS runs_by_workflow ON runs(workflow_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS events (run_id TEXT NOT NULL, sequence INTEGER NOT NULL, event_type INTEGER NOT NULL, event_time_ms INTEGER NOT NULL, "
      "data BLOB NOT NULL, PRIMARY KEY (run_id, sequence));",
      "CREATE TABLE IF NOT EXISTS tasks (queue_name TEXT NOT NULL, task_id TEXT NOT NULL, kind INTEGER NOT NULL, run_id TEXT NOT NULL, "
      "workflow_id TEXT NOT NULL, payload BLOB NOT NULL, created_at_ms INTEGER NOT NULL, visible_at_ms INTEGER NOT NULL, "
      "delivery_count INTEGER NOT NULL DEFAULT 0, lease_token TEXT NOT NULL DEFAULT '', lease_started_at_ms INTEGER NOT NULL DEFAULT 0, "
      "heartbeat_at_ms INTEGER NOT NULL DEFAULT 0, heartbeat_details BLOB, PRIMARY KEY (queue_name, task_id));",
      "CREATE INDEX IF NOT EXISTS tasks_by_visibility ON tasks(queue_name, visible_at_ms);",
  };
  return kSchema;
}

inline const std::vector<const char*>& PostgresSchema() {
  static const std::vector<const char*> kSchema = {
      "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, workflow_id TEXT NOT NULL, workflow_type TEXT NOT NULL, task_queue TEXT NOT NULL, "
      "input BYTEA, status SMALLINT NOT NULL, last_sequence BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "closed_at_ms BIGINT NOT NULL DEFAULT 0, execution_deadline_ms BIGINT NOT NULL DEFAULT 0, result BYTEA, failure BYTEA, "
      "seq BIGSERIAL);",
      "CREATE INDEX IF NOT EXISTS runs_by_workflow ON runs(workflow_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS events (run_id TEXT NOT NULL, sequence BIGINT NOT NULL, event_type SMALLINT NOT NULL, event_time_ms BIGINT NOT NULL, "
      "data BYTEA NOT NULL, PRIMARY KEY (run_id, sequence));",
      "CREATE TABLE IF NOT EXISTS tasks (queue_name TEXT NOT NULL, task_id TEXT NOT NULL, kind SMALLINT NOT NULL, run_id TEXT NOT NULL, "
      "workflow_id TEXT NOT NULL, payload BYTEA NOT NULL, created_at_ms BIGINT NOT NULL, visible_at_ms BIGINT NOT NULL, "
      "delivery_count INTEGER NOT NULL DEFAULT 0, lease_token TEXT NOT NULL DEFAULT '', lease_started_at_ms BIGINT NOT NULL DEFAULT 0, "
      "heartbeat_at_ms BIGINT NOT NULL DEFAULT 0, heartbeat_details BYTEA, seq BIGSERIAL, PRIMARY KEY (queue_name, task_id));",
      "CREATE INDEX IF NOT EXISTS tasks_by_visibility ON tasks(queue_name, visible_at_ms);",
  };
  return kSchema;
}

} // namespace weave::db::sql
