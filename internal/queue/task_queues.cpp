#include "task_queues.hpp"

namespace rtask::queue {

TaskQueues TaskQueues::Create(const QueueCapacities& capacities) {
  TaskQueues queues;
  queues.dispatch      = std::make_shared<DispatchQueue>(capacities.dispatch);
  queues.serial        = std::make_shared<TaskQueue>(capacities.serial);
  queues.parallel      = std::make_shared<TaskQueue>(capacities.parallel);
  queues.high_priority = std::make_shared<TaskQueue>(capacities.high_priority);
  return queues;
}

std::shared_ptr<TaskQueue> TaskQueues::ForAffinity(rtask::v1::Affinity affinity) const {
  switch (affinity) {
    case rtask::v1::AFFINITY_SERIAL:
      return serial;
    case rtask::v1::AFFINITY_PARALLEL:
      return parallel;
    case rtask::v1::AFFINITY_HIGH_PRIORITY:
      return high_priority;
    default:
      return nullptr;
  }
}

void TaskQueues::CloseWorkerQueues() const {
  serial->Close();
  parallel->Close();
  high_priority->Close();
}

} // namespace rtask::queue
