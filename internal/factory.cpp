#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if WEAVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WEAVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/schema.hpp"
#endif

namespace weave::factory {

using weave::observability::StringField;
using weave::runtime::config::RuntimeConfig;

namespace {

#if WEAVE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WEAVE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    WEAVE_LOG_INFO("using sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WEAVE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    WEAVE_LOG_INFO("using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WEAVE_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

const char* BackendName(const RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite";
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

worker::WorkerOptions WorkerOptionsFromConfig(const RuntimeConfig& config) {
  const auto& cfg = config.worker();

  worker::WorkerOptions options;
  if (!cfg.task_queue().empty()) options.task_queue = cfg.task_queue();
  if (cfg.decision_pollers() > 0) options.decision_pollers = cfg.decision_pollers();
  if (cfg.activity_pollers() > 0) options.activity_pollers = cfg.activity_pollers();
  if (cfg.has_poll_wait()) options.poll_wait = util::FromProto(cfg.poll_wait());
  if (cfg.has_heartbeat_interval()) options.heartbeat_interval = util::FromProto(cfg.heartbeat_interval());
  if (cfg.has_decision_visibility_timeout()) options.decision_visibility_timeout = util::FromProto(cfg.decision_visibility_timeout());
  if (cfg.has_start_to_close_grace()) options.start_to_close_grace = util::FromProto(cfg.start_to_close_grace());
  return options;
}

/*
    Build full engine dependency graph
*/
Engine Build(const RuntimeConfig& config) {
  Engine engine;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  engine.repository = BuildRepository(config);

  const uint64_t page_size = config.engine().history_page_size() == 0 ? 256 : config.engine().history_page_size();
  engine.event_log         = std::make_shared<history::EventLog>(engine.repository, page_size);
  engine.task_queue        = std::make_shared<queue::TaskQueue>(engine.repository);

  // ------------------------------------------------------------------
  // Orchestration
  // ------------------------------------------------------------------
  core::OrchestratorOptions orchestrator_options;
  if (!config.worker().task_queue().empty()) orchestrator_options.default_task_queue = config.worker().task_queue();
  if (config.engine().workflow_id_reuse_policy() != weave::v1::WORKFLOW_ID_REUSE_POLICY_UNSPECIFIED) {
    orchestrator_options.default_reuse_policy = config.engine().workflow_id_reuse_policy();
  }
  engine.orchestrator = std::make_shared<core::Orchestrator>(engine.repository, engine.event_log, engine.task_queue, orchestrator_options);

  const util::Millis sweep_interval =
      config.engine().has_sweep_interval() ? util::FromProto(config.engine().sweep_interval()) : util::Millis(1000);
  engine.sweeper =
      std::make_shared<core::TimeoutSweeper>(engine.repository, engine.event_log, engine.task_queue, engine.orchestrator, sweep_interval);

  // ------------------------------------------------------------------
  // Registries and worker
  // ------------------------------------------------------------------
  auto retry_policy = config.engine().has_default_retry_policy() ? config.engine().default_retry_policy() : retry::DefaultRetryPolicy();
  auto timeouts =
      config.engine().has_default_activity_timeouts() ? config.engine().default_activity_timeouts() : retry::DefaultActivityTimeouts();

  engine.workflows  = std::make_shared<workflow::WorkflowRegistry>();
  engine.activities = std::make_shared<workflow::ActivityRegistry>(retry_policy, timeouts);
  engine.worker     = std::make_shared<worker::Worker>(engine.repository, engine.event_log, engine.task_queue, engine.workflows,
                                                   engine.activities, WorkerOptionsFromConfig(config));

  return engine;
}

void Engine::Start() {
  sweeper->Start();
  worker->Start();
}

void Engine::Stop() {
  worker->Stop();
  sweeper->Stop();
  orchestrator->Shutdown();
  task_queue->Shutdown();
}

} // namespace weave::factory
