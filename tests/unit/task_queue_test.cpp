#include "internal/queue/task_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using weave::queue::TaskQueue;
using weave::util::Millis;

constexpr const char* kQueue = "orders:decision";

weave::v1::TaskPayload DecisionPayload(const std::string& run_id) {
  weave::v1::TaskPayload payload;
  payload.mutable_decision()->set_workflow_id("wf-" + run_id);
  payload.mutable_decision()->set_run_id(run_id);
  return payload;
}

TaskQueue MakeQueue() {
  return TaskQueue(std::make_shared<weave::db::memory::MemoryRepository>());
}

void TestQueueNames() {
  assert(weave::queue::DecisionQueue("orders") == "orders:decision");
  assert(weave::queue::ActivityQueue("orders") == "orders:activity");
}

void TestLeasedTaskIsInvisibleUntilAck() {
  auto queue = MakeQueue();
  queue.Enqueue(kQueue, DecisionPayload("run-1"));

  auto first = queue.Dequeue(kQueue, Millis(10000));
  assert(first.has_value());
  assert(first->DeliveryCount() == 1);
  assert(first->payload.decision().run_id() == "run-1");
  assert(first->record.kind == weave::v1::TASK_KIND_DECISION);

  // leased: nobody else sees it
  assert(!queue.Dequeue(kQueue, Millis(10000)).has_value());

  queue.Ack(*first);
  assert(!queue.Dequeue(kQueue, Millis(10000)).has_value());
}

void TestNackRedeliversWithHigherDeliveryCount() {
  auto queue = MakeQueue();
  queue.Enqueue(kQueue, DecisionPayload("run-1"));

  auto first = queue.Dequeue(kQueue, Millis(10000));
  assert(first.has_value());
  queue.Nack(*first);

  auto second = queue.Dequeue(kQueue, Millis(10000));
  assert(second.has_value());
  assert(second->TaskId() == first->TaskId());
  assert(second->DeliveryCount() == 2);
  assert(second->record.lease_token != first->record.lease_token);
}

void TestLapsedLeaseIsRedeliveredAndOldHandleIsStale() {
  auto queue = MakeQueue();
  queue.Enqueue(kQueue, DecisionPayload("run-1"));

  auto first = queue.Dequeue(kQueue, Millis(20));
  assert(first.has_value());

  std::this_thread::sleep_for(Millis(60));

  auto second = queue.Dequeue(kQueue, Millis(10000));
  assert(second.has_value());
  assert(second->DeliveryCount() == 2);

  bool threw = false;
  try {
    queue.Ack(*first);
  } catch (const weave::util::WorkerLeaseExpired&) {
    threw = true;
  }
  assert(threw && "a stale delivery must not ack the re-issued lease");

  threw = false;
  try {
    queue.Heartbeat(*first, Millis(1000));
  } catch (const weave::util::WorkerLeaseExpired&) {
    threw = true;
  }
  assert(threw);

  queue.Ack(*second);
}

void TestHeartbeatExtendsLeaseAndKeepsDetails() {
  auto queue = MakeQueue();
  queue.Enqueue(kQueue, DecisionPayload("run-1"));

  auto task = queue.Dequeue(kQueue, Millis(30));
  assert(task.has_value());

  std::this_thread::sleep_for(Millis(15));
  queue.Heartbeat(*task, Millis(10000), "50%");
  std::this_thread::sleep_for(Millis(40));

  // original 30ms lease would have lapsed by now
  assert(!queue.Dequeue(kQueue, Millis(10000)).has_value());
  assert(task->record.heartbeat_details == "50%");

  queue.Nack(*task);
  auto again = queue.Dequeue(kQueue, Millis(10000));
  assert(again.has_value());
  assert(again->record.heartbeat_details == "50%");
}

void TestDelayedTaskBecomesVisible() {
  auto queue = MakeQueue();
  queue.Enqueue(kQueue, DecisionPayload("run-1"), Millis(50));

  assert(!queue.Dequeue(kQueue, Millis(1000)).has_value());

  auto tx    = queue.Repository().Begin();
  auto depth = queue.Depth(*tx, kQueue);
  tx->Commit();
  assert(depth.has_value());
  assert(depth->delayed == 1);
  assert(depth->ready == 0);

  auto task = queue.Poll(kQueue, Millis(1000), Millis(2000));
  assert(task.has_value());
}

void TestPollWakesOnEnqueue() {
  auto queue = MakeQueue();

  std::thread producer([&] {
    std::this_thread::sleep_for(Millis(30));
    queue.Enqueue(kQueue, DecisionPayload("run-2"));
  });

  auto task = queue.Poll(kQueue, Millis(1000), Millis(5000));
  producer.join();
  assert(task.has_value());
  assert(task->payload.decision().run_id() == "run-2");
}

void TestPollReturnsEmptyAfterShutdown() {
  auto queue = MakeQueue();
  queue.Shutdown();
  assert(!queue.Poll(kQueue, Millis(1000), Millis(5000)).has_value());
}

void TestEnqueueRejectsEmptyPayload() {
  auto queue = MakeQueue();

  bool threw = false;
  try {
    queue.Enqueue(kQueue, weave::v1::TaskPayload{});
  } catch (const weave::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQueueNames();
  TestLeasedTaskIsInvisibleUntilAck();
  TestNackRedeliversWithHigherDeliveryCount();
  TestLapsedLeaseIsRedeliveredAndOldHandleIsStale();
  TestHeartbeatExtendsLeaseAndKeepsDetails();
  TestDelayedTaskBecomesVisible();
  TestPollWakesOnEnqueue();
  TestPollReturnsEmptyAfterShutdown();
  TestEnqueueRejectsEmptyPayload();

  std::cout << "weave_unit_task_queue: pass\n";
  return 0;
}
