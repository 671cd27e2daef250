#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/history/event_log.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/registry.hpp"

namespace weave::worker {

struct WorkerOptions {
  std::string task_queue       = "default";
  uint32_t    decision_pollers = 1;
  uint32_t    activity_pollers = 2;

  // longest a poller blocks on an empty queue before re-checking for Stop()
  util::Millis poll_wait{1000};

  // automatic lease extension while a handler runs. Never longer than a third
  // of the activity's heartbeat timeout; 0 derives it from that timeout alone
  util::Millis heartbeat_interval{0};

  // slack past start-to-close before an activity lease lapses, so the worker
  // or the sweeper records the timeout before the task can be redelivered
  util::Millis start_to_close_grace{2000};

  // lease taken on dequeue; activity leases are re-sized once the task is read
  util::Millis decision_visibility_timeout{10000};

  // redelivery delay for a decision task of a workflow type this worker does not know
  util::Millis unknown_workflow_delay{1000};

  util::Millis error_backoff{100};
  util::Millis max_error_backoff{5000};
};

/*
  Executes decision, timer and activity tasks of one task queue.

  Decision tasks replay the workflow and commit the resulting events,
  follow-on tasks and the task ack in one transaction. Activity tasks run
  the registered handler and report the outcome the same way. A lost
  lease or a lost append race discards the work; the task is redelivered
  and the store stays consistent.

  Start() launches decision_pollers + activity_pollers threads; Stop()
  stops polling and waits for in-flight tasks. RunDecisionOnce() and
  RunActivityOnce() process a single task on the calling thread.
*/
class Worker {
 public:
  Worker(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::EventLog> event_log,
         std::shared_ptr<queue::TaskQueue> task_queue, std::shared_ptr<const workflow::WorkflowRegistry> workflows,
         std::shared_ptr<const workflow::ActivityRegistry> activities, WorkerOptions options);
  ~Worker();

  void Start();
  void Stop();

  // true if a task was processed
  bool RunDecisionOnce(util::Millis wait = util::Millis(0));
  bool RunActivityOnce(util::Millis wait = util::Millis(0));

  const WorkerOptions& Options() const {
    return options_;
  }

 private:
  void PollLoop(weave::v1::TaskKind kind);

  void Dispatch(queue::LeasedTask& task);
  void HandleDecision(queue::LeasedTask& task);
  void HandleTimer(queue::LeasedTask& task);
  void HandleActivity(queue::LeasedTask& task);

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<history::EventLog>                event_log_;
  std::shared_ptr<queue::TaskQueue>                 task_queue_;
  std::shared_ptr<const workflow::WorkflowRegistry> workflows_;
  std::shared_ptr<const workflow::ActivityRegistry> activities_;
  WorkerOptions                                     options_;

  std::string decision_queue_;
  std::string activity_queue_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace weave::worker
