#include "worker_pool.hpp"

#include <exception>

#include "internal/execution/execution_controller.hpp"
#include "internal/model/task_changes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/task_type_registry.hpp"
#include "internal/store/task_store.hpp"
#include "internal/util/errors.hpp"
#include "task_runner.hpp"

namespace rtask::worker {

using rtask::observability::IntField;
using rtask::observability::StringField;
using rtask::observability::TaskIdField;

namespace {

constexpr const char* kShutdownAbort = "Task execution aborted: engine shutting down";

} // namespace

WorkerPool::WorkerPool(WorkerPoolOptions options, std::shared_ptr<rtask::queue::TaskQueue> queue,
                       std::shared_ptr<rtask::store::TaskStore> store, std::shared_ptr<const rtask::registry::TaskTypeRegistry> registry,
                       std::shared_ptr<rtask::execution::ExecutionController> controller)
    : options_(std::move(options)),
      queue_(std::move(queue)),
      store_(std::move(store)),
      registry_(std::move(registry)),
      controller_(std::move(controller)) {
  if (options_.workers == 0) {
    throw util::InvalidArgument("worker pool '" + options_.name + "' needs at least one worker");
  }
}

WorkerPool::~WorkerPool() {
  Join();
}

void WorkerPool::Start() {
  threads_.reserve(options_.workers);
  for (std::size_t i = 0; i < options_.workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  RTASK_LOG_INFO("Worker pool started", {StringField("pool", options_.name), IntField("workers", static_cast<int64_t>(options_.workers)),
                                         observability::BoolField("pausable", options_.respect_pause)});
}

void WorkerPool::Join() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (auto task = queue_->Pop()) {
    try {
      Process(*task);
    } catch (const std::exception& e) {
      RTASK_LOG_ERROR("Worker failed to process task",
                      {StringField("pool", options_.name), TaskIdField(task->id()), StringField("error", e.what())});
    }
  }
}

void WorkerPool::Process(const rtask::v1::Task& task) {
  const auto task_id = task.id();

  auto claimed = store_->TransitionTask(task_id, {rtask::v1::TASK_STATE_NEW}, model::StateChange(rtask::v1::TASK_STATE_PROCESSING));
  if (!claimed) {
    RTASK_LOG_TASK_INFO("Skipping task that is no longer new", task, {StringField("pool", options_.name)});
    return;
  }

  if (options_.respect_pause && !controller_->WaitUntilRunning()) {
    if (store_->TransitionTask(task_id, {rtask::v1::TASK_STATE_PROCESSING}, model::FailedChange({kShutdownAbort}))) {
      RTASK_LOG_TASK_WARN("Aborted paused task at shutdown", task, {StringField("pool", options_.name)});
    }
    return;
  }

  auto current = store_->GetTask(task_id);
  if (!current || current->state() != rtask::v1::TASK_STATE_PROCESSING) {
    RTASK_LOG_TASK_INFO("Skipping task cancelled before execution", current ? *current : task, {StringField("pool", options_.name)});
    return;
  }

  RTASK_LOG_TASK_DEBUG("Running task", *current, {StringField("pool", options_.name)});

  const auto changes = RunTask(*current, *registry_);

  if (!store_->TransitionTask(task_id, {rtask::v1::TASK_STATE_PROCESSING}, changes)) {
    RTASK_LOG_TASK_WARN("Discarding result of task cancelled during execution", *current, {StringField("pool", options_.name)});
  }
}

} // namespace rtask::worker
