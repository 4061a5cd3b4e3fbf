#pragma once

#include <memory>

#include "rtask/v1.hpp"

namespace rtask::core {
class TaskManager;
}

namespace rtask::service {

/*
  Request/response facade over the task manager, the surface a transport
  (REST, console) exposes to clients.

  Sorting and filtering of task listings happen here, not in the engine.
*/
class TaskService {
 public:
  explicit TaskService(std::shared_ptr<rtask::core::TaskManager> manager);

  rtask::v1::Task              AddTask(const rtask::v1::AddTaskRequest& req);
  rtask::v1::Task              GetTask(const rtask::v1::GetTaskRequest& req);
  rtask::v1::ListTasksResponse ListTasks(const rtask::v1::ListTasksRequest& req);

  // Returns the task after cancellation.
  rtask::v1::Task CancelTask(const rtask::v1::CancelTaskRequest& req);

  rtask::v1::Event              GetEvent(const rtask::v1::GetEventRequest& req);
  rtask::v1::ListEventsResponse ListEvents(const rtask::v1::ListEventsRequest& req);

  rtask::v1::ListTaskTypesResponse ListTaskTypes();

  rtask::v1::StatusResponse Pause();
  rtask::v1::StatusResponse Resume();
  rtask::v1::StatusResponse Status();

 private:
  std::shared_ptr<rtask::core::TaskManager> manager_;
};

} // namespace rtask::service
