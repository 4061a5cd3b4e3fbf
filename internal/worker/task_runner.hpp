#pragma once

#include <google/protobuf/struct.pb.h>

#include "rtask/v1/task.pb.h"

namespace rtask::registry {
class TaskTypeRegistry;
}

namespace rtask::worker {

/*
  Runs the handler registered for the task's type and returns the change set
  to record:

    {state: COMPLETE, result: <handler result>}
    {state: FAILED, errors: [<message>]}     handler threw
    {state: FAILED, errors: ["No handler for task type <type>"]}

  Never throws for handler failures.
*/
google::protobuf::Struct RunTask(const rtask::v1::Task& task, const rtask::registry::TaskTypeRegistry& registry);

} // namespace rtask::worker
