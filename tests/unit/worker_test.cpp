#include "internal/worker/worker.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cctype>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/worker/activity_context.hpp"
#include "test_engine.hpp"

namespace {

using namespace weave::v1;
using weave::testing::TestEngine;
using weave::util::Millis;
using weave::workflow::ActivityOptions;
using weave::workflow::WorkflowContext;
using weave::workflow::WorkflowDefinition;

class GreetingWorkflow : public WorkflowDefinition {
 public:
  void Run(WorkflowContext& ctx) override {
    const std::string greeting = ctx.ExecuteActivity("greet", ctx.Input()).Get();
    const std::string shouted  = ctx.ExecuteActivity("shout", greeting).Get();
    ctx.Complete(greeting + " / " + shouted);
  }
};

class SingleActivityWorkflow : public WorkflowDefinition {
 public:
  void Run(WorkflowContext& ctx) override {
    ActivityOptions options;
    weave::v1::RetryPolicy policy;
    policy.set_maximum_attempts(5);
    options.retry_policy = policy;
    ctx.Complete(ctx.ExecuteActivity(ctx.Input(), "", options).Get());
  }
};

class SleepyWorkflow : public WorkflowDefinition {
 public:
  void Run(WorkflowContext& ctx) override {
    ctx.StartTimer(Millis(30)).Wait();
    ctx.Complete("awake");
  }
};

std::string Greet(weave::worker::ActivityContext& ctx) {
  return "hello " + ctx.Input();
}

std::string Shout(weave::worker::ActivityContext& ctx) {
  std::string out = ctx.Input();
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

weave::core::StartWorkflowOptions WithId(const std::string& workflow_id) {
  weave::core::StartWorkflowOptions options;
  options.workflow_id = workflow_id;
  return options;
}

void TestSequentialActivitiesComplete() {
  TestEngine engine;
  engine.workflows->Register<GreetingWorkflow>("Greeting");
  engine.activities->Register("greet", Greet);
  engine.activities->Register("shout", Shout);
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Greeting", "world", WithId("wf-a"));
  assert(engine.DriveUntilClosed("wf-a"));

  auto outcome = engine.orchestrator->GetResult("wf-a", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);
  assert(outcome.run.result == "hello world / HELLO WORLD");
  assert(engine.CountEvents("wf-a", EVENT_TYPE_ACTIVITY_COMPLETED) == 2);
}

void TestRetryableFailuresRetryUntilSuccess() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");
  engine.activities->Register("flaky", [&calls](weave::worker::ActivityContext& ctx) -> std::string {
    calls++;
    if (ctx.Attempt() < 3) throw weave::util::ActivityFailure("Transient", "try again");
    return "ok on attempt " + std::to_string(ctx.Attempt());
  });
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "flaky", WithId("wf-b"));
  assert(engine.DriveUntilClosed("wf-b"));

  auto outcome = engine.orchestrator->GetResult("wf-b", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);
  assert(outcome.run.result == "ok on attempt 3");
  assert(calls == 3);

  // one activity id, three schedules, one completion
  const auto history = engine.orchestrator->GetHistory("wf-b").events;
  size_t     scheduled = 0;
  for (const auto& event : history) {
    if (event.event_type() != EVENT_TYPE_ACTIVITY_SCHEDULED) continue;
    scheduled++;
    assert(event.activity_scheduled().activity_id() == "activity-1");
    assert(event.activity_scheduled().attempt() == scheduled);
    if (scheduled > 1) assert(event.activity_scheduled().last_failure().category() == "Transient");
  }
  assert(scheduled == 3);
  assert(engine.CountEvents("wf-b", EVENT_TYPE_ACTIVITY_COMPLETED) == 1);
  assert(engine.CountEvents("wf-b", EVENT_TYPE_ACTIVITY_FAILED) == 0);
}

void TestNonRetryableFailureFailsWorkflow() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");
  engine.activities->Register("strict", [&calls](weave::worker::ActivityContext&) -> std::string {
    calls++;
    throw weave::util::ActivityFailure("ValidationError", "bad input", true);
  });
  auto& worker = engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "strict", WithId("wf-c"));
  assert(engine.DriveUntilClosed("wf-c"));

  auto outcome = engine.orchestrator->GetResult("wf-c", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure.has_value());
  assert(outcome.failure->category() == "ValidationError");
  assert(calls == 1);
  assert(engine.CountEvents("wf-c", EVENT_TYPE_ACTIVITY_SCHEDULED) == 1);
  assert(engine.CountEvents("wf-c", EVENT_TYPE_ACTIVITY_FAILED) == 1);
  assert(!worker.RunActivityOnce());
}

void TestAbandonedActivityIsRedelivered() {
  TestEngine            engine;
  std::atomic<uint32_t> completed_delivery{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");
  engine.activities->Register("durable", [&completed_delivery](weave::worker::ActivityContext& ctx) -> std::string {
    completed_delivery = ctx.Delivery();
    return "survived";
  });
  auto& worker = engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "durable", WithId("wf-d"));
  assert(worker.RunDecisionOnce());

  // a worker takes the task with a short lease, then dies without reporting
  auto crashed = engine.task_queue->Dequeue(weave::queue::ActivityQueue("default"), Millis(30));
  assert(crashed.has_value());
  assert(!worker.RunActivityOnce());

  std::this_thread::sleep_for(Millis(60));

  assert(engine.DriveUntilClosed("wf-d"));
  auto outcome = engine.orchestrator->GetResult("wf-d", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);
  assert(outcome.run.result == "survived");
  assert(completed_delivery == 2);

  // the dead worker's late report is rejected
  bool threw = false;
  try {
    engine.task_queue->Ack(*crashed);
  } catch (const weave::util::WorkerLeaseExpired&) {
    threw = true;
  }
  assert(threw);
}

void TestHeartbeatKeepsLongActivityLeased() {
  TestEngine        engine;
  std::atomic<bool> stolen{false};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_heartbeat() = weave::util::ToProto(Millis(50));
  engine.activities->Register(
      "long",
      [&engine, &stolen](weave::worker::ActivityContext&) -> std::string {
        std::this_thread::sleep_for(Millis(200));
        stolen = engine.task_queue->Dequeue(weave::queue::ActivityQueue("default"), Millis(1000)).has_value();
        return "done";
      },
      {}, timeouts);

  weave::worker::WorkerOptions options;
  options.heartbeat_interval = Millis(10);
  engine.MakeWorker(options);

  engine.orchestrator->StartWorkflow("Single", "long", WithId("wf-hb"));
  assert(engine.DriveUntilClosed("wf-hb"));
  assert(!stolen && "lease must stay active while the worker heartbeats");
  assert(engine.orchestrator->GetStatus("wf-hb").status == WORKFLOW_STATUS_COMPLETED);
}

void TestHeartbeatIntervalClampedToHeartbeatTimeout() {
  TestEngine        engine;
  std::atomic<bool> stolen{false};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_heartbeat() = weave::util::ToProto(Millis(50));
  engine.activities->Register(
      "long",
      [&engine, &stolen](weave::worker::ActivityContext&) -> std::string {
        std::this_thread::sleep_for(Millis(300));
        stolen = engine.task_queue->Dequeue(weave::queue::ActivityQueue("default"), Millis(1000)).has_value();
        return "done";
      },
      {}, timeouts);

  // configured slower than the heartbeat timeout allows
  weave::worker::WorkerOptions options;
  options.heartbeat_interval = Millis(100);
  engine.MakeWorker(options);

  engine.orchestrator->StartWorkflow("Single", "long", WithId("wf-hb-clamp"));
  assert(engine.DriveUntilClosed("wf-hb-clamp"));
  assert(!stolen);
  assert(engine.orchestrator->GetStatus("wf-hb-clamp").status == WORKFLOW_STATUS_COMPLETED);
  assert(engine.CountEvents("wf-hb-clamp", EVENT_TYPE_ACTIVITY_SCHEDULED) == 1);
}

void TestHeartbeatDerivedWhenIntervalUnset() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_heartbeat() = weave::util::ToProto(Millis(60));
  engine.activities->Register(
      "quiet",
      [&calls](weave::worker::ActivityContext&) -> std::string {
        calls++;
        std::this_thread::sleep_for(Millis(250));
        return "done";
      },
      {}, timeouts);

  weave::worker::WorkerOptions options;
  options.poll_wait = Millis(20);
  auto& worker      = engine.MakeWorker(options);
  worker.Start();

  engine.orchestrator->StartWorkflow("Single", "quiet", WithId("wf-hb-derived"));
  auto outcome = engine.orchestrator->GetResult("wf-hb-derived", Millis(5000));
  worker.Stop();

  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);
  assert(calls == 1);
}

void TestStartToCloseEnforcedWithoutSweeper() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_start_to_close() = weave::util::ToProto(Millis(100));
  engine.activities->Register(
      "overrun",
      [&calls](weave::worker::ActivityContext&) -> std::string {
        calls++;
        std::this_thread::sleep_for(Millis(300));
        return "too late";
      },
      {}, timeouts);
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "overrun", WithId("wf-overrun"));
  assert(engine.DriveUntilClosed("wf-overrun"));

  auto outcome = engine.orchestrator->GetResult("wf-overrun", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == weave::retry::kTimeoutCategory);
  assert(calls == 1);
  assert(engine.CountEvents("wf-overrun", EVENT_TYPE_ACTIVITY_COMPLETED) == 0);
}

void TestStartToCloseEnforcedByBackgroundSweeper() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_start_to_close() = weave::util::ToProto(Millis(100));
  engine.activities->Register(
      "stuck",
      [&calls](weave::worker::ActivityContext&) -> std::string {
        calls++;
        std::this_thread::sleep_for(Millis(400));
        return "too late";
      },
      {}, timeouts);

  weave::worker::WorkerOptions options;
  options.poll_wait            = Millis(20);
  options.start_to_close_grace = Millis(200);
  auto& worker                 = engine.MakeWorker(options);
  weave::core::TimeoutSweeper sweeper(engine.repository, engine.event_log, engine.task_queue, engine.orchestrator, Millis(20));
  worker.Start();
  sweeper.Start();

  engine.orchestrator->StartWorkflow("Single", "stuck", WithId("wf-stuck"));
  auto outcome = engine.orchestrator->GetResult("wf-stuck", Millis(4000));
  sweeper.Stop();
  worker.Stop();

  assert(!outcome.still_running);
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == weave::retry::kTimeoutCategory);
  assert(calls == 1);
}

void TestPolicyNonRetryableCategoryStopsRetries() {
  TestEngine       engine;
  std::atomic<int> calls{0};
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::RetryPolicy policy;
  policy.add_non_retryable_categories("PaymentDeclined");
  engine.activities->Register(
      "charge",
      [&calls](weave::worker::ActivityContext&) -> std::string {
        calls++;
        throw weave::util::ActivityFailure("PaymentDeclined", "card refused");
      },
      policy);
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "charge", WithId("wf-declined"));
  assert(engine.DriveUntilClosed("wf-declined"));

  auto outcome = engine.orchestrator->GetResult("wf-declined", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == "PaymentDeclined");
  assert(calls == 1);
  assert(engine.CountEvents("wf-declined", EVENT_TYPE_ACTIVITY_SCHEDULED) == 1);
  assert(engine.CountEvents("wf-declined", EVENT_TYPE_ACTIVITY_FAILED) == 1);
}

void TestRedeliveryCarriesLastHeartbeatDetails() {
  TestEngine            engine;
  std::atomic<uint32_t> delivery{0};
  std::string           resumed_from;
  engine.workflows->Register<SingleActivityWorkflow>("Single");

  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_heartbeat() = weave::util::ToProto(Millis(40));
  engine.activities->Register(
      "resumable",
      [&delivery, &resumed_from](weave::worker::ActivityContext& ctx) -> std::string {
        delivery     = ctx.Delivery();
        resumed_from = ctx.PreviousHeartbeatDetails();
        return "resumed";
      },
      {}, timeouts);
  auto& worker = engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "resumable", WithId("wf-resume"));
  assert(worker.RunDecisionOnce());

  // first delivery records progress once, then its worker dies
  auto crashed = engine.task_queue->Dequeue(weave::queue::ActivityQueue("default"), Millis(40));
  assert(crashed.has_value());
  engine.task_queue->Heartbeat(*crashed, Millis(40), "batch-7");
  assert(!worker.RunActivityOnce());

  std::this_thread::sleep_for(Millis(80));

  assert(engine.DriveUntilClosed("wf-resume"));
  assert(engine.orchestrator->GetResult("wf-resume", Millis(0)).run.result == "resumed");
  assert(delivery == 2);
  assert(resumed_from == "batch-7");
  assert(engine.CountEvents("wf-resume", EVENT_TYPE_ACTIVITY_SCHEDULED) == 1);
}

void TestTimerFiresAndResumesWorkflow() {
  TestEngine engine;
  engine.workflows->Register<SleepyWorkflow>("Sleepy");
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Sleepy", "", WithId("wf-timer"));
  assert(engine.DriveUntilClosed("wf-timer"));

  assert(engine.orchestrator->GetResult("wf-timer", Millis(0)).run.result == "awake");
  assert(engine.CountEvents("wf-timer", EVENT_TYPE_TIMER_STARTED) == 1);
  assert(engine.CountEvents("wf-timer", EVENT_TYPE_TIMER_FIRED) == 1);
}

void TestUnregisteredActivityRetriesThenFails() {
  TestEngine engine;
  engine.workflows->Register<SingleActivityWorkflow>("Single");
  engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Single", "ghost", WithId("wf-ghost"));
  assert(engine.DriveUntilClosed("wf-ghost"));

  auto outcome = engine.orchestrator->GetResult("wf-ghost", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == "ActivityNotRegistered");
  assert(engine.CountEvents("wf-ghost", EVENT_TYPE_ACTIVITY_SCHEDULED) == 5);
}

void TestUnknownWorkflowTypeStaysQueued() {
  TestEngine engine;
  auto&      worker = engine.MakeWorker();

  engine.orchestrator->StartWorkflow("Unknown", "", WithId("wf-unknown"));
  assert(worker.RunDecisionOnce());

  // nacked with a delay, the run is untouched
  assert(!worker.RunDecisionOnce());
  assert(engine.orchestrator->GetStatus("wf-unknown").status == WORKFLOW_STATUS_RUNNING);
  assert(engine.orchestrator->GetHistory("wf-unknown").events.size() == 1);
}

void TestBackgroundPollersCompleteWorkflow() {
  TestEngine engine;
  engine.workflows->Register<GreetingWorkflow>("Greeting");
  engine.activities->Register("greet", Greet);
  engine.activities->Register("shout", Shout);

  weave::worker::WorkerOptions options;
  options.poll_wait = Millis(50);
  auto& worker      = engine.MakeWorker(options);
  worker.Start();

  engine.orchestrator->StartWorkflow("Greeting", "pollers", WithId("wf-bg"));
  auto outcome = engine.orchestrator->GetResult("wf-bg", Millis(5000));
  worker.Stop();

  assert(!outcome.still_running);
  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);
  assert(outcome.run.result == "hello pollers / HELLO POLLERS");
}

} // namespace

int main() {
  TestSequentialActivitiesComplete();
  TestRetryableFailuresRetryUntilSuccess();
  TestNonRetryableFailureFailsWorkflow();
  TestAbandonedActivityIsRedelivered();
  TestHeartbeatKeepsLongActivityLeased();
  TestHeartbeatIntervalClampedToHeartbeatTimeout();
  TestHeartbeatDerivedWhenIntervalUnset();
  TestStartToCloseEnforcedWithoutSweeper();
  TestStartToCloseEnforcedByBackgroundSweeper();
  TestPolicyNonRetryableCategoryStopsRetries();
  TestRedeliveryCarriesLastHeartbeatDetails();
  TestTimerFiresAndResumesWorkflow();
  TestUnregisteredActivityRetriesThenFails();
  TestUnknownWorkflowTypeStaysQueued();
  TestBackgroundPollersCompleteWorkflow();

  std::cout << "weave_unit_worker: pass\n";
  return 0;
}
