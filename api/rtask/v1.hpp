#pragma once

#include "rtask/v1/task.pb.h"
#include "rtask/v1/task_service.pb.h"
