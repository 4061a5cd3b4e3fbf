#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/queue/task_queues.hpp"
#include "internal/registry/task_type_registry.hpp"
#include "rtask/v1/task.pb.h"

namespace rtask::store {
class TaskStore;
}
namespace rtask::execution {
class ExecutionController;
}
namespace rtask::dispatch {
class DispatchRouter;
}
namespace rtask::worker {
class WorkerPool;
}

namespace rtask::core {

struct TaskManagerOptions {
  rtask::queue::QueueCapacities queues;
  bool                          start_paused = false;
};

/*
  Task execution engine.

  Owns the type registry, the task store, the queues, the dispatch router,
  the worker pools and the execution controller.

  Tasks are accepted as soon as the manager exists; nothing executes until
  InitWorkers() starts the router and the pools.
*/
class TaskManager {
 public:
  explicit TaskManager(TaskManagerOptions options = {});
  ~TaskManager();

  TaskManager(const TaskManager&)            = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  void RegisterTaskType(const std::string& type, rtask::registry::Handler handler,
                        rtask::v1::Affinity affinity = rtask::v1::AFFINITY_SERIAL);
  std::vector<rtask::registry::TaskType> TaskTypes() const;

  // Starts the router, one serial worker, `num_parallel` parallel workers and
  // one high priority worker. Returns false if already initialized.
  bool InitWorkers(std::size_t num_parallel);

  // Serial and parallel tasks go through the dispatch router, high priority
  // tasks straight to their worker. Blocks while the target queue is full.
  // Throws util::InvalidArgument for an unregistered type and
  // util::InvalidState after Shutdown(); neither consumes a task id.
  rtask::v1::Task AddTask(const std::string& type, const google::protobuf::Struct& options = {});

  // Returns the task as it was before the update.
  rtask::v1::Task UpdateTask(uint64_t id, const google::protobuf::Struct& changes);

  // NEW or PROCESSING -> CANCELLED. Returns the task as it was before.
  // Throws util::NotFound, or util::InvalidState for a finished task.
  rtask::v1::Task CancelTask(uint64_t id);

  std::optional<rtask::v1::Task>  GetTask(uint64_t id) const;
  std::vector<rtask::v1::Task>    GetTasks() const;
  std::optional<rtask::v1::Event> GetEvent(uint64_t id) const;
  std::vector<rtask::v1::Event>   GetEvents() const;
  std::vector<rtask::v1::Event>   GetTaskEvents(uint64_t task_id) const;

  uint64_t LastTaskId() const;
  uint64_t LastEventId() const;

  void PauseExecution();
  void ResumeExecution();
  bool IsExecutionPaused() const;

  // Closes every queue and waits for the router and the workers to drain
  // them. Running handlers are not interrupted. Idempotent.
  void Shutdown();

 private:
  std::shared_ptr<rtask::registry::TaskTypeRegistry>     registry_;
  std::shared_ptr<rtask::store::TaskStore>               store_;
  std::shared_ptr<rtask::execution::ExecutionController> controller_;
  rtask::queue::TaskQueues                               queues_;

  std::mutex                                              lifecycle_mutex_;
  bool                                                    initialized_ = false;
  bool                                                    shut_down_   = false;
  std::unique_ptr<rtask::dispatch::DispatchRouter>        router_;
  std::vector<std::unique_ptr<rtask::worker::WorkerPool>> pools_;
};

} // namespace rtask::core
