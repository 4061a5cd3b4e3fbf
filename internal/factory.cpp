#include "factory.hpp"

#include "internal/handlers/builtin_handlers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/task_service.hpp"

namespace rtask::factory {

namespace {

std::size_t OrDefault(uint32_t value, std::size_t fallback) {
  return value == 0 ? fallback : static_cast<std::size_t>(value);
}

} // namespace

rtask::core::TaskManagerOptions ManagerOptions(const rtask::runtime::config::RuntimeConfig& config) {
  rtask::core::TaskManagerOptions options;
  const auto&                     queues = config.queues();

  options.queues.dispatch      = OrDefault(queues.dispatch_capacity(), options.queues.dispatch);
  options.queues.serial        = OrDefault(queues.serial_capacity(), options.queues.serial);
  options.queues.parallel      = OrDefault(queues.parallel_capacity(), options.queues.parallel);
  options.queues.high_priority = OrDefault(queues.high_priority_capacity(), options.queues.high_priority);
  options.start_paused         = config.execution().start_paused();
  return options;
}

std::size_t ParallelWorkers(const rtask::runtime::config::RuntimeConfig& config) {
  return OrDefault(config.workers().parallel(), kDefaultParallelWorkers);
}

Application Build(const rtask::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.manager = std::make_shared<rtask::core::TaskManager>(ManagerOptions(config));
  rtask::handlers::RegisterBuiltinTaskTypes(*app.manager);

  const auto parallel = ParallelWorkers(config);
  app.manager->InitWorkers(parallel);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.service = std::make_shared<rtask::service::TaskService>(app.manager);

  RTASK_LOG_INFO("Task engine ready", {observability::IntField("parallel_workers", static_cast<int64_t>(parallel)),
                                       observability::BoolField("paused", app.manager->IsExecutionPaused())});
  return app;
}

} // namespace rtask::factory
