#pragma once

#include "rtask/v1/task.pb.h"

namespace rtask::model {

/*
  NEW -> PROCESSING -> COMPLETE | FAILED
  NEW | PROCESSING -> CANCELLED
*/

constexpr bool IsTerminal(rtask::v1::TaskState state) {
  return state == rtask::v1::TASK_STATE_COMPLETE || state == rtask::v1::TASK_STATE_FAILED ||
         state == rtask::v1::TASK_STATE_CANCELLED;
}

} // namespace rtask::model
