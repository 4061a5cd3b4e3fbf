#include "builtin_handlers.hpp"

#include <chrono>
#include <cmath>
#include <thread>

#include "internal/core/task_manager.hpp"
#include "internal/util/errors.hpp"

namespace rtask::handlers {

namespace {

constexpr double kMaxSleepMs = 60000;

} // namespace

google::protobuf::Value Echo(const rtask::v1::Task& task) {
  google::protobuf::Value result;
  *result.mutable_struct_value() = task.fields();
  return result;
}

google::protobuf::Value Sleep(const rtask::v1::Task& task) {
  double duration_ms = 0;

  const auto& fields = task.fields().fields();
  auto        it     = fields.find("duration_ms");
  if (it != fields.end()) {
    if (it->second.kind_case() != google::protobuf::Value::kNumberValue) {
      throw util::InvalidArgument("duration_ms must be a number");
    }
    duration_ms = it->second.number_value();
  }
  if (!std::isfinite(duration_ms) || duration_ms < 0 || duration_ms > kMaxSleepMs) {
    throw util::InvalidArgument("duration_ms must be between 0 and 60000");
  }

  const auto slept = std::chrono::milliseconds(static_cast<int64_t>(duration_ms));
  std::this_thread::sleep_for(slept);

  google::protobuf::Value result;
  (*result.mutable_struct_value()->mutable_fields())["slept_ms"].set_number_value(static_cast<double>(slept.count()));
  return result;
}

void RegisterBuiltinTaskTypes(rtask::core::TaskManager& manager) {
  manager.RegisterTaskType("echo", Echo, rtask::v1::AFFINITY_SERIAL);
  manager.RegisterTaskType("sleep", Sleep, rtask::v1::AFFINITY_PARALLEL);
}

} // namespace rtask::handlers
