#pragma once

#include <cstdint>
#include <memory>
#include <thread>

#include "internal/queue/task_queues.hpp"

namespace rtask::store {
class TaskStore;
}

namespace rtask::dispatch {

/*
  Moves newly created tasks from the dispatch queue to the worker queue that
  matches their stored affinity.

  Single thread. Exits once the dispatch queue is closed and drained.
  Never writes to the store. A full worker queue holds the router back;
  high priority tasks do not pass through here, so pause can only delay
  serial and parallel work.
*/
class DispatchRouter {
 public:
  DispatchRouter(rtask::queue::TaskQueues queues, std::shared_ptr<const rtask::store::TaskStore> store);
  ~DispatchRouter();

  DispatchRouter(const DispatchRouter&)            = delete;
  DispatchRouter& operator=(const DispatchRouter&) = delete;

  void Start();

  // Waits for the loop to finish; close the dispatch queue first.
  void Join();

  // Routes one task id. Returns false if the task was dropped.
  bool Route(uint64_t task_id);

 private:
  void Run();

  rtask::queue::TaskQueues                       queues_;
  std::shared_ptr<const rtask::store::TaskStore> store_;
  std::thread                                    thread_;
};

} // namespace rtask::dispatch
