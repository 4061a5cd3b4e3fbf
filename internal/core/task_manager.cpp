#include "task_manager.hpp"

#include "internal/dispatch/dispatch_router.hpp"
#include "internal/execution/execution_controller.hpp"
#include "internal/model/task_changes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/task_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/worker_pool.hpp"

namespace rtask::core {

using rtask::v1::Event;
using rtask::v1::Task;

TaskManager::TaskManager(TaskManagerOptions options)
    : registry_(std::make_shared<rtask::registry::TaskTypeRegistry>()),
      store_(std::make_shared<rtask::store::TaskStore>()),
      controller_(std::make_shared<rtask::execution::ExecutionController>(options.start_paused)),
      queues_(rtask::queue::TaskQueues::Create(options.queues)) {
}

TaskManager::~TaskManager() {
  Shutdown();
}

void TaskManager::RegisterTaskType(const std::string& type, rtask::registry::Handler handler, rtask::v1::Affinity affinity) {
  registry_->Register(type, std::move(handler), affinity);
}

std::vector<rtask::registry::TaskType> TaskManager::TaskTypes() const {
  return registry_->List();
}

bool TaskManager::InitWorkers(std::size_t num_parallel) {
  std::lock_guard lock(lifecycle_mutex_);
  if (initialized_) {
    return false;
  }
  if (shut_down_) {
    throw util::InvalidState("task manager is shut down");
  }
  if (num_parallel == 0) {
    throw util::InvalidArgument("at least one parallel worker is required");
  }

  router_ = std::make_unique<rtask::dispatch::DispatchRouter>(queues_, store_);

  pools_.push_back(std::make_unique<rtask::worker::WorkerPool>(rtask::worker::WorkerPoolOptions{"high_priority", 1, false}, queues_.high_priority,
                                                               store_, registry_, controller_));
  pools_.push_back(
      std::make_unique<rtask::worker::WorkerPool>(rtask::worker::WorkerPoolOptions{"serial", 1, true}, queues_.serial, store_, registry_, controller_));
  pools_.push_back(std::make_unique<rtask::worker::WorkerPool>(rtask::worker::WorkerPoolOptions{"parallel", num_parallel, true}, queues_.parallel,
                                                               store_, registry_, controller_));

  router_->Start();
  for (auto& pool : pools_) {
    pool->Start();
  }

  initialized_ = true;
  return true;
}

Task TaskManager::AddTask(const std::string& type, const google::protobuf::Struct& options) {
  auto type_info = registry_->Lookup(type);
  if (!type_info) {
    throw util::InvalidArgument("Unrecognized task type " + type);
  }

  if (queues_.dispatch->IsClosed()) {
    throw util::InvalidState("task manager is shut down");
  }

  Task draft;
  *draft.mutable_fields() = options;
  draft.set_type(type);
  draft.set_affinity(type_info->affinity);

  // The task is stored inside the push, under the queue lock: ids reach each
  // queue in order, and a closed queue never leaves a task behind.
  Task task;
  auto store_draft = [&] {
    draft.set_created_ms(util::NowMillis());
    task = store_->AddTask(std::move(draft));
    return task;
  };

  // High priority tasks skip the router so that pausable tasks waiting for
  // queue space can never hold them back.
  const bool queued = type_info->affinity == rtask::v1::AFFINITY_HIGH_PRIORITY
                          ? queues_.high_priority->PushWith(store_draft)
                          : queues_.dispatch->PushWith([&] { return store_draft().id(); });
  if (!queued) {
    throw util::InvalidState("task manager is shut down");
  }

  RTASK_LOG_TASK_DEBUG("Task added", task);
  return task;
}

Task TaskManager::UpdateTask(uint64_t id, const google::protobuf::Struct& changes) {
  return store_->UpdateTask(id, changes);
}

Task TaskManager::CancelTask(uint64_t id) {
  auto prior = store_->TransitionTask(id, {rtask::v1::TASK_STATE_NEW, rtask::v1::TASK_STATE_PROCESSING},
                                      model::StateChange(rtask::v1::TASK_STATE_CANCELLED));
  if (!prior) {
    const auto current = store_->GetTask(id);
    throw util::InvalidState("task " + std::to_string(id) + " already finished: " +
                             model::StateName(current ? current->state() : rtask::v1::TASK_STATE_UNSPECIFIED));
  }

  RTASK_LOG_TASK_INFO("Task cancelled", *prior);
  return *prior;
}

std::optional<Task> TaskManager::GetTask(uint64_t id) const {
  return store_->GetTask(id);
}

std::vector<Task> TaskManager::GetTasks() const {
  return store_->GetTasks();
}

std::optional<Event> TaskManager::GetEvent(uint64_t id) const {
  return store_->GetEvent(id);
}

std::vector<Event> TaskManager::GetEvents() const {
  return store_->GetEvents();
}

std::vector<Event> TaskManager::GetTaskEvents(uint64_t task_id) const {
  return store_->GetTaskEvents(task_id);
}

uint64_t TaskManager::LastTaskId() const {
  return store_->LastTaskId();
}

uint64_t TaskManager::LastEventId() const {
  return store_->LastEventId();
}

void TaskManager::PauseExecution() {
  controller_->Pause();
}

void TaskManager::ResumeExecution() {
  controller_->Resume();
}

bool TaskManager::IsExecutionPaused() const {
  return controller_->IsPaused();
}

void TaskManager::Shutdown() {
  std::lock_guard lock(lifecycle_mutex_);
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  // Stop intake before releasing paused workers: freed queue space must not
  // admit new tasks.
  queues_.dispatch->Close();
  controller_->Shutdown();

  if (router_) router_->Join();

  queues_.CloseWorkerQueues();
  for (auto& pool : pools_) {
    pool->Join();
  }

  RTASK_LOG_INFO("Task manager stopped", {observability::IntField("last_task_id", static_cast<int64_t>(store_->LastTaskId())),
                                          observability::IntField("last_event_id", static_cast<int64_t>(store_->LastEventId()))});
}

} // namespace rtask::core
