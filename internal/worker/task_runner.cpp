#include "task_runner.hpp"

#include <exception>
#include <string>

#include "internal/model/task_changes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/task_type_registry.hpp"

namespace rtask::worker {

using rtask::observability::StringField;

google::protobuf::Struct RunTask(const rtask::v1::Task& task, const rtask::registry::TaskTypeRegistry& registry) {
  auto type = registry.Lookup(task.type());
  if (!type) {
    return model::FailedChange({"No handler for task type " + task.type()});
  }

  try {
    return model::CompleteChange(type->handler(task));
  } catch (const std::exception& e) {
    RTASK_LOG_TASK_WARN("Task handler failed", task, {StringField("error", e.what())});
    return model::FailedChange({e.what()});
  } catch (...) {
    RTASK_LOG_TASK_WARN("Task handler failed", task, {StringField("error", "non-standard exception")});
    return model::FailedChange({"unknown handler error"});
  }
}

} // namespace rtask::worker
