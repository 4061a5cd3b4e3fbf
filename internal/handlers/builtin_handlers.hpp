#pragma once

#include <google/protobuf/struct.pb.h>

#include "rtask/v1/task.pb.h"

namespace rtask::core {
class TaskManager;
}

namespace rtask::handlers {

// Returns the task's fields unchanged.
google::protobuf::Value Echo(const rtask::v1::Task& task);

// Sleeps for fields.duration_ms (0..60000) and returns {"slept_ms": n}.
google::protobuf::Value Sleep(const rtask::v1::Task& task);

// echo: serial, sleep: parallel
void RegisterBuiltinTaskTypes(rtask::core::TaskManager& manager);

} // namespace rtask::handlers
