#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "bounded_queue.hpp"
#include "rtask/v1/task.pb.h"

namespace rtask::queue {

// Newly created task ids waiting for the router.
using DispatchQueue = BoundedQueue<uint64_t>;

// Tasks routed to one worker pool.
using TaskQueue = BoundedQueue<rtask::v1::Task>;

struct QueueCapacities {
  std::size_t dispatch      = 500;
  std::size_t serial        = 500;
  std::size_t parallel      = 50;
  std::size_t high_priority = 50;
};

struct TaskQueues {
  std::shared_ptr<DispatchQueue> dispatch;
  std::shared_ptr<TaskQueue>     serial;
  std::shared_ptr<TaskQueue>     parallel;
  std::shared_ptr<TaskQueue>     high_priority;

  static TaskQueues Create(const QueueCapacities& capacities);

  // nullptr for AFFINITY_UNSPECIFIED or unknown values
  std::shared_ptr<TaskQueue> ForAffinity(rtask::v1::Affinity affinity) const;

  void CloseWorkerQueues() const;
};

} // namespace rtask::queue
