#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if WEAVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if WEAVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/schema.hpp"
#endif

namespace {

using weave::db::ErrorCode;
using weave::db::Repository;
using weave::db::memory::MemoryRepository;
using weave::db::model::EventRecord;
using weave::db::model::RunRecord;
using weave::db::model::TaskRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RunRecord MakeRun(const std::string& run_id, const std::string& workflow_id, uint64_t created_at_ms) {
  RunRecord run;
  run.run_id        = run_id;
  run.workflow_id   = workflow_id;
  run.workflow_type = "ParityWorkflow";
  run.task_queue    = "default";
  run.input         = R"({"k":"v"})";
  run.status        = weave::v1::WORKFLOW_STATUS_RUNNING;
  run.created_at_ms = created_at_ms;
  run.updated_at_ms = created_at_ms;
  return run;
}

TaskRecord MakeTask(const std::string& queue, const std::string& task_id, uint64_t visible_at_ms) {
  TaskRecord task;
  task.queue_name    = queue;
  task.task_id       = task_id;
  task.kind          = weave::v1::TASK_KIND_ACTIVITY;
  task.run_id        = "run-" + task_id;
  task.workflow_id   = "wf-" + task_id;
  task.payload       = "payload-" + task_id;
  task.created_at_ms = visible_at_ms;
  task.visible_at_ms = visible_at_ms;
  return task;
}

EventRecord MakeEvent(int32_t type, const std::string& data) {
  EventRecord e;
  e.event_type    = type;
  e.event_time_ms = NowMs();
  e.data          = data;
  return e;
}

bool ContainsRun(const std::vector<RunRecord>& runs, const std::string& run_id) {
  for (const auto& r : runs) {
    if (r.run_id == run_id) return true;
  }
  return false;
}

void VerifyRunLifecycle(Repository& repo, const std::string& prefix) {
  const auto now      = NowMs();
  const auto wf       = prefix + "-wf";
  const auto first_id = prefix + "-run-1";
  const auto next_id  = prefix + "-run-2";

  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(first_id, wf, now)));
    tx->Commit();
  }

  {
    // postgres aborts the transaction on a unique violation
    auto tx  = repo.Begin();
    auto dup = repo.InsertRun(*tx, MakeRun(first_id, wf, now));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetRun(*tx, first_id);
  assert(read.has_value());
  assert(read->workflow_id == wf);
  assert(read->workflow_type == "ParityWorkflow");
  assert(read->input == R"({"k":"v"})");
  assert(read->status == weave::v1::WORKFLOW_STATUS_RUNNING);

  read->status       = weave::v1::WORKFLOW_STATUS_COMPLETED;
  read->result       = "done";
  read->closed_at_ms = now + 5;
  assert(repo.UpdateRun(*tx, *read));

  assert(repo.InsertRun(*tx, MakeRun(next_id, wf, now + 10)));
  tx->Commit();

  auto rx     = repo.Begin();
  auto latest = repo.GetLatestRun(*rx, wf);
  assert(latest.has_value());
  assert(latest->run_id == next_id);

  auto closed = repo.GetRun(*rx, first_id);
  assert(closed->status == weave::v1::WORKFLOW_STATUS_COMPLETED);
  assert(closed->result == "done");
  assert(closed->closed_at_ms == now + 5);

  auto completed = repo.ListRunsByStatus(*rx, weave::v1::WORKFLOW_STATUS_COMPLETED);
  assert(ContainsRun(completed, first_id));
  assert(!ContainsRun(completed, next_id));

  assert(!repo.GetRun(*rx, prefix + "-missing").has_value());
  assert(!repo.GetLatestRun(*rx, prefix + "-no-such-workflow").has_value());

  auto missing = repo.UpdateRun(*rx, MakeRun(prefix + "-missing", wf, now));
  assert(missing.code == ErrorCode::NotFound);
  rx->Rollback();
}

void VerifyExpiredRuns(Repository& repo, const std::string& prefix) {
  const auto now = NowMs();

  auto expired                  = MakeRun(prefix + "-expired", prefix + "-wf-expired", now);
  expired.execution_deadline_ms = now - 1;

  auto later                  = MakeRun(prefix + "-later", prefix + "-wf-later", now);
  later.execution_deadline_ms = now + 60'000;

  auto unbounded = MakeRun(prefix + "-unbounded", prefix + "-wf-unbounded", now);

  auto closed                  = MakeRun(prefix + "-closed", prefix + "-wf-closed", now);
  closed.execution_deadline_ms = now - 1;
  closed.status                = weave::v1::WORKFLOW_STATUS_FAILED;

  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, expired));
  assert(repo.InsertRun(*tx, later));
  assert(repo.InsertRun(*tx, unbounded));
  assert(repo.InsertRun(*tx, closed));
  tx->Commit();

  auto rx   = repo.Begin();
  auto runs = repo.ListExpiredRuns(*rx, now);
  assert(ContainsRun(runs, expired.run_id));
  assert(!ContainsRun(runs, later.run_id));
  assert(!ContainsRun(runs, unbounded.run_id));
  assert(!ContainsRun(runs, closed.run_id));
  rx->Commit();
}

void VerifyEventAppendAndPaging(Repository& repo, const std::string& run_id) {
  {
    auto tx = repo.Begin();
    assert(repo.LastEventSequence(*tx, run_id) == 0);

    std::vector<EventRecord> batch{MakeEvent(1, "e1"), MakeEvent(2, "e2"), MakeEvent(3, "e3")};
    assert(repo.AppendEvents(*tx, run_id, 0, batch));
    assert(batch[0].sequence == 1);
    assert(batch[2].sequence == 3);
    assert(batch[1].run_id == run_id);
    tx->Commit();
  }

  {
    // a writer that read version 0 before the commit above must lose
    auto                     tx = repo.Begin();
    std::vector<EventRecord> stale{MakeEvent(9, "stale")};
    auto                     conflict = repo.AppendEvents(*tx, run_id, 0, stale);
    assert(!conflict);
    assert(conflict.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> more{MakeEvent(4, "e4"), MakeEvent(5, "e5")};
    assert(repo.AppendEvents(*tx, run_id, 3, more));
    tx->Commit();
  }

  auto rx = repo.Begin();
  assert(repo.LastEventSequence(*rx, run_id) == 5);

  auto page1 = repo.ReadEvents(*rx, run_id, 0, 2);
  assert(page1.size() == 2);
  assert(page1[0].sequence == 1 && page1[0].data == "e1");
  assert(page1[1].sequence == 2 && page1[1].event_type == 2);

  auto page2 = repo.ReadEvents(*rx, run_id, page1.back().sequence, 2);
  assert(page2.size() == 2);
  assert(page2[0].sequence == 3);
  assert(page2[1].sequence == 4);

  auto tail = repo.ReadEvents(*rx, run_id, 4, 100);
  assert(tail.size() == 1);
  assert(tail[0].data == "e5");

  assert(repo.ReadEvents(*rx, run_id, 5, 100).empty());
  assert(repo.ReadEvents(*rx, run_id + "-unknown", 0, 100).empty());
  rx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(prefix + "-run", prefix + "-wf", NowMs())));
    std::vector<EventRecord> batch{MakeEvent(1, "discarded")};
    assert(repo.AppendEvents(*tx, prefix + "-run", 0, batch));
    assert(repo.GetRun(*tx, prefix + "-run").has_value());
    tx->Rollback();
  }

  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-q", "t1", NowMs())));
  }

  auto rx = repo.Begin();
  assert(!repo.GetRun(*rx, prefix + "-run").has_value());
  assert(repo.LastEventSequence(*rx, prefix + "-run") == 0);
  assert(!repo.GetTask(*rx, prefix + "-q", "t1").has_value());
  rx->Commit();
}

void VerifyTaskLeasing(Repository& repo, const std::string& queue) {
  const auto now = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(queue, "a", now - 20)));
    assert(repo.InsertTask(*tx, MakeTask(queue, "b", now - 10)));
    // not visible for another minute
    assert(repo.InsertTask(*tx, MakeTask(queue, "delayed", now + 60'000)));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(queue, "a", now)).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  std::string first_token = queue + "-lease-1";
  {
    auto tx     = repo.Begin();
    auto leased = repo.LeaseNextTask(*tx, queue, now, now + 1'000, first_token);
    assert(leased.has_value());
    assert(leased->task_id == "a");
    assert(leased->delivery_count == 1);
    assert(leased->lease_token == first_token);
    assert(leased->visible_at_ms == now + 1'000);
    assert(leased->lease_started_at_ms == now);
    assert(leased->payload == "payload-a");
    assert(leased->IsLeased(now));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto next = repo.LeaseNextTask(*tx, queue, now, now + 1'000, queue + "-lease-2");
    assert(next.has_value());
    assert(next->task_id == "b");

    // a is leased and delayed is in the future
    assert(!repo.LeaseNextTask(*tx, queue, now, now + 1'000, queue + "-lease-3").has_value());
    tx->Commit();
  }

  {
    // lease on a lapses; it is handed out again with a bumped delivery count
    auto tx        = repo.Begin();
    auto redeliver = repo.LeaseNextTask(*tx, queue, now + 1'001, now + 2'000, queue + "-lease-4");
    assert(redeliver.has_value());
    assert(redeliver->task_id == "a" || redeliver->task_id == "b");
    assert(redeliver->delivery_count == 2);
    assert(redeliver->lease_token == queue + "-lease-4");
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto task = repo.GetTask(*tx, queue, "delayed");
    assert(task.has_value());
    assert(task->delivery_count == 0);
    assert(task->lease_token.empty());

    task->heartbeat_at_ms   = now + 5;
    task->heartbeat_details = "progress=50";
    task->visible_at_ms     = now + 30'000;
    assert(repo.UpdateTask(*tx, *task));

    auto updated = repo.GetTask(*tx, queue, "delayed");
    assert(updated->heartbeat_details == "progress=50");
    assert(updated->visible_at_ms == now + 30'000);

    assert(repo.ListTasks(*tx, queue).size() == 3);
    assert(repo.DeleteTask(*tx, queue, "delayed"));
    assert(repo.DeleteTask(*tx, queue, "delayed").code == ErrorCode::NotFound);
    assert(repo.ListTasks(*tx, queue).size() == 2);

    auto missing = MakeTask(queue, "ghost", now);
    assert(repo.UpdateTask(*tx, missing).code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyTaskListings(Repository& repo, const std::string& prefix) {
  const auto now        = NowMs();
  const auto decisions  = prefix + ":decision";
  const auto activities = prefix + ":activity";

  auto decision = MakeTask(decisions, "d1", now);
  decision.kind = weave::v1::TASK_KIND_DECISION;

  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, decision));
  assert(repo.InsertTask(*tx, MakeTask(activities, "x1", now)));
  assert(repo.InsertTask(*tx, MakeTask(activities, "x2", now + 1)));
  tx->Commit();

  auto rx = repo.Begin();

  auto by_kind = repo.ListTasksByKind(*rx, weave::v1::TASK_KIND_DECISION);
  bool found   = false;
  for (const auto& t : by_kind) {
    assert(t.kind == weave::v1::TASK_KIND_DECISION);
    if (t.queue_name == decisions && t.task_id == "d1") found = true;
  }
  assert(found);

  auto queued = repo.ListTasks(*rx, activities);
  assert(queued.size() == 2);
  assert(queued[0].task_id == "x1");
  assert(queued[1].task_id == "x2");

  auto queues       = repo.ListQueues(*rx);
  bool has_decision = false;
  bool has_activity = false;
  for (const auto& q : queues) {
    if (q == decisions) has_decision = true;
    if (q == activities) has_activity = true;
  }
  assert(has_decision && has_activity);
  rx->Commit();
}

// Two starts of one workflow id: the second waits and then sees the first run.
void VerifyWorkflowIdLockSerializesStarts(Repository& repo, const std::string& prefix) {
  const std::string workflow_id = prefix + "-wf";

  auto first = repo.Begin();
  assert(repo.LockWorkflowId(*first, workflow_id));
  assert(!repo.GetLatestRun(*first, workflow_id).has_value());
  assert(repo.InsertRun(*first, MakeRun(prefix + "-a", workflow_id, NowMs())));

  std::atomic<bool> second_locked{false};
  std::string       seen_by_second;
  std::thread       second_start([&] {
    auto second = repo.Begin();
    assert(repo.LockWorkflowId(*second, workflow_id));
    second_locked = true;
    auto latest   = repo.GetLatestRun(*second, workflow_id);
    if (latest.has_value()) seen_by_second = latest->run_id;
    second->Rollback();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(!second_locked && "second start must wait for the first to finish");
  first->Commit();
  second_start.join();

  assert(second_locked);
  assert(seen_by_second == prefix + "-a");

  // released with the first transaction
  auto holder = repo.Begin();
  assert(repo.LockWorkflowId(*holder, workflow_id));
  holder->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, MakeRun(prefix + "-run", prefix + "-wf", NowMs())));
    std::vector<EventRecord> batch{MakeEvent(1, "started")};
    assert(repo->AppendEvents(*tx, prefix + "-run", 0, batch));
    assert(repo->InsertTask(*tx, MakeTask(prefix + "-q", "durable", NowMs())));
    tx->Commit();
  }

  backend.restart(repo);

  auto rx  = repo->Begin();
  auto run = repo->GetRun(*rx, prefix + "-run");
  assert(run.has_value());
  assert(run->workflow_type == "ParityWorkflow");
  assert(repo->LastEventSequence(*rx, prefix + "-run") == 1);
  assert(repo->GetTask(*rx, prefix + "-q", "durable").has_value());
  rx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if WEAVE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("weave_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<weave::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<weave::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if WEAVE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("WEAVE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("WEAVE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<weave::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const char* sql : weave::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<weave::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared postgres database can be reused
  const auto tag = backend.name + "-" + std::to_string(NowMs());

  VerifyRunLifecycle(*repo, tag + "-runs");
  VerifyExpiredRuns(*repo, tag + "-expiry");
  VerifyEventAppendAndPaging(*repo, tag + "-events");
  VerifyRollbackDiscardsWrites(*repo, tag + "-rollback");
  VerifyTaskLeasing(*repo, tag + "-lease");
  VerifyTaskListings(*repo, tag + "-listing");
  VerifyWorkflowIdLockSerializesStarts(*repo, tag + "-start-lock");

  repo.reset();
  VerifyRestartDurability(backend, tag + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if WEAVE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if WEAVE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "weave_integration_repository_parity: pass\n";
  return 0;
}
