#pragma once

#include <cstddef>
#include <memory>

#include "config/config.pb.h"
#include "internal/core/task_manager.hpp"

namespace rtask::service {
class TaskService;
}

namespace rtask::factory {

inline constexpr std::size_t kDefaultParallelWorkers = 4;

/*
  Application

  Owns the long-lived objects of the process.
*/
struct Application {
  std::shared_ptr<rtask::core::TaskManager>    manager;
  std::shared_ptr<rtask::service::TaskService> service;
};

// Zero values in the config select the defaults.
rtask::core::TaskManagerOptions ManagerOptions(const rtask::runtime::config::RuntimeConfig& config);
std::size_t                     ParallelWorkers(const rtask::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: creates the engine, registers the built-in task types
  and starts the workers.
*/
Application Build(const rtask::runtime::config::RuntimeConfig& config);

} // namespace rtask::factory
