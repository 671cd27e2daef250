#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/history/event_log.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/time.hpp"

namespace weave::core {

class Orchestrator;

struct SweepReport {
  size_t runs_timed_out       = 0;
  size_t activities_timed_out = 0;
  size_t lapsed_leases        = 0;
};

/*
  Background loop enforcing deadlines nobody else is waiting on.

  Each pass:
      expired workflow execution deadline  -> WorkflowTimedOut
      activity past schedule-to-close      -> ActivityFailed(Timeout) + decision task
      activity whose attempt started more than start-to-close ago (lease live or lapsed)
                                           -> ActivityFailed(Timeout) + decision task
      lapsed lease                         -> logged once; the queue redelivers it

  A timed out activity task is deleted in the same transaction, so the
  worker still running it loses its lease and its outcome is discarded.
*/
class TimeoutSweeper {
 public:
  TimeoutSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
                 std::shared_ptr<queue::TaskQueue> task_queue, std::shared_ptr<Orchestrator> orchestrator, util::Millis interval);
  ~TimeoutSweeper();

  void Start();
  void Stop();

  SweepReport SweepOnce();

 private:
  void Run();

  size_t SweepRuns();
  void   SweepActivities(SweepReport& report);
  bool   TimeOutActivity(const db::model::TaskRecord& seen, const std::string& reason);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<history::EventLog> event_log_;
  std::shared_ptr<queue::TaskQueue>  task_queue_;
  std::shared_ptr<Orchestrator>      orchestrator_;
  util::Millis                       interval_;

  // lease tokens already reported as lapsed
  std::unordered_set<std::string> reported_lapses_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace weave::core
