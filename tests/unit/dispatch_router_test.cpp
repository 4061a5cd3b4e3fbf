#include "internal/dispatch/dispatch_router.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/store/task_store.hpp"

namespace {

using rtask::dispatch::DispatchRouter;
using rtask::queue::QueueCapacities;
using rtask::queue::TaskQueues;
using rtask::store::TaskStore;

uint64_t AddTask(TaskStore& store, rtask::v1::Affinity affinity) {
  rtask::v1::Task draft;
  draft.set_type("route");
  draft.set_affinity(affinity);
  return store.AddTask(draft).id();
}

void TestRoutesByAffinity() {
  auto queues = TaskQueues::Create(QueueCapacities{});
  auto store  = std::make_shared<TaskStore>();

  const auto serial   = AddTask(*store, rtask::v1::AFFINITY_SERIAL);
  const auto parallel = AddTask(*store, rtask::v1::AFFINITY_PARALLEL);
  const auto urgent   = AddTask(*store, rtask::v1::AFFINITY_HIGH_PRIORITY);

  DispatchRouter router(queues, store);
  router.Start();
  for (auto id : {serial, parallel, urgent}) {
    const bool pushed = queues.dispatch->Push(id);
    assert(pushed);
  }
  queues.dispatch->Close();
  router.Join();

  assert(queues.serial->Size() == 1);
  assert(queues.parallel->Size() == 1);
  assert(queues.high_priority->Size() == 1);
  assert(queues.serial->Pop()->id() == serial);
  assert(queues.parallel->Pop()->id() == parallel);
  assert(queues.high_priority->Pop()->id() == urgent);
}

void TestPreservesOrderWithinQueue() {
  auto queues = TaskQueues::Create(QueueCapacities{});
  auto store  = std::make_shared<TaskStore>();

  DispatchRouter router(queues, store);
  router.Start();
  for (int i = 0; i < 20; ++i) {
    const bool pushed = queues.dispatch->Push(AddTask(*store, rtask::v1::AFFINITY_SERIAL));
    assert(pushed);
  }
  queues.dispatch->Close();
  router.Join();

  for (uint64_t expected = 1; expected <= 20; ++expected) {
    assert(queues.serial->Pop()->id() == expected);
  }
}

void TestDropsUnknownAndUnroutableTasks() {
  auto queues = TaskQueues::Create(QueueCapacities{});
  auto store  = std::make_shared<TaskStore>();

  DispatchRouter router(queues, store);
  assert(!router.Route(99));

  const auto unroutable = AddTask(*store, rtask::v1::AFFINITY_UNSPECIFIED);
  assert(!router.Route(unroutable));

  assert(queues.serial->Size() == 0);
  assert(queues.parallel->Size() == 0);
  assert(queues.high_priority->Size() == 0);
}

void TestDropsWhenWorkerQueueClosed() {
  auto queues = TaskQueues::Create(QueueCapacities{});
  auto store  = std::make_shared<TaskStore>();
  queues.CloseWorkerQueues();

  DispatchRouter router(queues, store);
  assert(!router.Route(AddTask(*store, rtask::v1::AFFINITY_PARALLEL)));
  assert(queues.parallel->Size() == 0);
}

} // namespace

int main() {
  TestRoutesByAffinity();
  TestPreservesOrderWithinQueue();
  TestDropsUnknownAndUnroutableTasks();
  TestDropsWhenWorkerQueueClosed();

  std::cout << "rtask_unit_dispatch_router: pass\n";
  return 0;
}
