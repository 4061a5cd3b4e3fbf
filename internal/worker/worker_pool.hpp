#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/queue/task_queues.hpp"

namespace rtask::store {
class TaskStore;
}
namespace rtask::registry {
class TaskTypeRegistry;
}
namespace rtask::execution {
class ExecutionController;
}

namespace rtask::worker {

struct WorkerPoolOptions {
  std::string name;
  std::size_t workers       = 1;
  bool        respect_pause = true;
};

/*
  Worker threads draining one task queue.

  Per task:
      NEW -> PROCESSING              on dequeue
      wait while paused              pausable pools only
      PROCESSING -> COMPLETE|FAILED  after the handler returns

  A task cancelled before its handler starts is skipped. A task cancelled
  while its handler runs keeps CANCELLED; the handler result is dropped.
*/
class WorkerPool {
 public:
  WorkerPool(WorkerPoolOptions options, std::shared_ptr<rtask::queue::TaskQueue> queue, std::shared_ptr<rtask::store::TaskStore> store,
             std::shared_ptr<const rtask::registry::TaskTypeRegistry> registry,
             std::shared_ptr<rtask::execution::ExecutionController> controller);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Waits for every worker; close the queue first.
  void Join();

  const std::string& Name() const {
    return options_.name;
  }

  std::size_t Size() const {
    return options_.workers;
  }

 private:
  void Run();
  void Process(const rtask::v1::Task& task);

  WorkerPoolOptions                                        options_;
  std::shared_ptr<rtask::queue::TaskQueue>                 queue_;
  std::shared_ptr<rtask::store::TaskStore>                 store_;
  std::shared_ptr<const rtask::registry::TaskTypeRegistry> registry_;
  std::shared_ptr<rtask::execution::ExecutionController>   controller_;

  std::vector<std::thread> threads_;
};

} // namespace rtask::worker
