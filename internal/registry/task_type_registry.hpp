#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "rtask/v1/task.pb.h"

namespace rtask::registry {

/*
  Task handlers take the task being executed and return its result.
  A handler signals failure by throwing; the worker records the exception
  message on the task.
*/
using Handler = std::function<google::protobuf::Value(const rtask::v1::Task&)>;

struct TaskType {
  std::string         name;
  Handler             handler;
  rtask::v1::Affinity affinity = rtask::v1::AFFINITY_SERIAL;
};

/*
  Task type -> handler and affinity.

  Populated at startup and read on every task creation and execution.
  Re-registering a type replaces the previous entry.
*/
class TaskTypeRegistry {
 public:
  void Register(const std::string& type, Handler handler, rtask::v1::Affinity affinity = rtask::v1::AFFINITY_SERIAL);

  std::optional<TaskType> Lookup(const std::string& type) const;

  std::vector<TaskType> List() const;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                 mutex_;
  std::unordered_map<std::string, TaskType> types_;
};

} // namespace rtask::registry
