#include "task_type_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rtask::registry {

void TaskTypeRegistry::Register(const std::string& type, Handler handler, rtask::v1::Affinity affinity) {
  if (type.empty()) {
    throw util::InvalidArgument("task type name must not be empty");
  }
  if (!handler) {
    throw util::InvalidArgument("task type '" + type + "' registered without a handler");
  }
  if (affinity == rtask::v1::AFFINITY_UNSPECIFIED || !rtask::v1::Affinity_IsValid(affinity)) {
    throw util::InvalidArgument("task type '" + type + "' registered with an invalid affinity");
  }

  {
    std::unique_lock lock(mutex_);
    types_[type] = TaskType{type, std::move(handler), affinity};
  }

  RTASK_LOG_INFO("Registered task type", {observability::StringField("type", type),
                                          observability::StringField("affinity", rtask::v1::Affinity_Name(affinity))});
}

std::optional<TaskType> TaskTypeRegistry::Lookup(const std::string& type) const {
  std::shared_lock lock(mutex_);
  auto             it = types_.find(type);
  if (it == types_.end()) return std::nullopt;
  return it->second;
}

std::vector<TaskType> TaskTypeRegistry::List() const {
  std::vector<TaskType> types;
  {
    std::shared_lock lock(mutex_);
    types.reserve(types_.size());
    for (const auto& [_, type] : types_) {
      types.push_back(type);
    }
  }
  std::sort(types.begin(), types.end(), [](const TaskType& a, const TaskType& b) { return a.name < b.name; });
  return types;
}

std::size_t TaskTypeRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return types_.size();
}

} // namespace rtask::registry
