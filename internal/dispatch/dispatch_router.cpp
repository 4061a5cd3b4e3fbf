#include "dispatch_router.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/store/task_store.hpp"

namespace rtask::dispatch {

using rtask::observability::StringField;
using rtask::observability::TaskIdField;

DispatchRouter::DispatchRouter(rtask::queue::TaskQueues queues, std::shared_ptr<const rtask::store::TaskStore> store)
    : queues_(std::move(queues)), store_(std::move(store)) {
}

DispatchRouter::~DispatchRouter() {
  Join();
}

void DispatchRouter::Start() {
  thread_ = std::thread(&DispatchRouter::Run, this);
}

void DispatchRouter::Join() {
  if (thread_.joinable()) thread_.join();
}

bool DispatchRouter::Route(uint64_t task_id) {
  auto task = store_->GetTask(task_id);
  if (!task) {
    RTASK_LOG_WARN("Dropping dispatch of unknown task", {TaskIdField(task_id)});
    return false;
  }

  auto target = queues_.ForAffinity(task->affinity());
  if (!target) {
    RTASK_LOG_TASK_ERROR("Dropping task with no queue for its affinity", *task);
    return false;
  }

  if (!target->Push(*task)) {
    RTASK_LOG_TASK_WARN("Dropping task, worker queue closed", *task);
    return false;
  }
  RTASK_LOG_TASK_DEBUG("Routed task", *task);
  return true;
}

void DispatchRouter::Run() {
  while (auto task_id = queues_.dispatch->Pop()) {
    try {
      Route(*task_id);
    } catch (const std::exception& e) {
      RTASK_LOG_ERROR("Dispatch failed", {TaskIdField(*task_id), StringField("error", e.what())});
    }
  }
  RTASK_LOG_DEBUG("Dispatch router stopped");
}

} // namespace rtask::dispatch
