#include "task_service.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/core/task_manager.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/task_changes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rtask::service {

using namespace rtask::v1;

namespace {

template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      RTASK_LOG_DEBUG("Call complete", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      RTASK_LOG_DEBUG("Call complete", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    RTASK_LOG_WARN("Call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                   observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

void RequireId(uint64_t id, std::string_view what) {
  if (id == 0) {
    throw util::InvalidArgument(std::string(what) + " id must be positive");
  }
}

} // namespace

TaskService::TaskService(std::shared_ptr<rtask::core::TaskManager> manager) : manager_(std::move(manager)) {
}

Task TaskService::AddTask(const AddTaskRequest& req) {
  return ObserveCall("TaskService.AddTask", [&] {
    if (req.type().empty()) {
      throw util::InvalidArgument("task type is required");
    }
    return manager_->AddTask(req.type(), req.fields());
  });
}

Task TaskService::GetTask(const GetTaskRequest& req) {
  return ObserveCall("TaskService.GetTask", [&] {
    RequireId(req.id(), "task");
    auto task = manager_->GetTask(req.id());
    if (!task) {
      throw util::NotFound("task " + std::to_string(req.id()) + " not found");
    }
    return *task;
  });
}

ListTasksResponse TaskService::ListTasks(const ListTasksRequest& req) {
  return ObserveCall("TaskService.ListTasks", [&] {
    auto tasks = manager_->GetTasks();

    if (req.state() != TASK_STATE_UNSPECIFIED) {
      tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [&](const Task& task) { return task.state() != req.state(); }), tasks.end());
    }

    // stable: ties keep id order
    if (req.sort() == SORT_ORDER_OLDEST_FIRST) {
      std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) { return a.created_ms() < b.created_ms(); });
    } else if (req.sort() == SORT_ORDER_NEWEST_FIRST) {
      std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) { return a.created_ms() > b.created_ms(); });
    }

    ListTasksResponse resp;
    resp.mutable_tasks()->Reserve(static_cast<int>(tasks.size()));
    for (auto& task : tasks) {
      *resp.add_tasks() = std::move(task);
    }
    return resp;
  });
}

Task TaskService::CancelTask(const CancelTaskRequest& req) {
  return ObserveCall("TaskService.CancelTask", [&] {
    RequireId(req.id(), "task");
    manager_->CancelTask(req.id());
    auto task = manager_->GetTask(req.id());
    if (!task) {
      throw util::NotFound("task " + std::to_string(req.id()) + " not found");
    }
    return *task;
  });
}

Event TaskService::GetEvent(const GetEventRequest& req) {
  return ObserveCall("TaskService.GetEvent", [&] {
    RequireId(req.id(), "event");
    auto event = manager_->GetEvent(req.id());
    if (!event) {
      throw util::NotFound("event " + std::to_string(req.id()) + " not found");
    }
    return *event;
  });
}

ListEventsResponse TaskService::ListEvents(const ListEventsRequest& req) {
  return ObserveCall("TaskService.ListEvents", [&] {
    auto events = req.task() == 0 ? manager_->GetEvents() : manager_->GetTaskEvents(req.task());

    ListEventsResponse resp;
    resp.mutable_events()->Reserve(static_cast<int>(events.size()));
    for (auto& event : events) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

ListTaskTypesResponse TaskService::ListTaskTypes() {
  return ObserveCall("TaskService.ListTaskTypes", [&] {
    ListTaskTypesResponse resp;
    for (const auto& type : manager_->TaskTypes()) {
      auto* info = resp.add_types();
      info->set_type(type.name);
      info->set_affinity(type.affinity);
    }
    return resp;
  });
}

StatusResponse TaskService::Pause() {
  return ObserveCall("TaskService.Pause", [&] {
    manager_->PauseExecution();
    return Status();
  });
}

StatusResponse TaskService::Resume() {
  return ObserveCall("TaskService.Resume", [&] {
    manager_->ResumeExecution();
    return Status();
  });
}

StatusResponse TaskService::Status() {
  StatusResponse resp;
  resp.set_paused(manager_->IsExecutionPaused());

  // ids first so the listing below covers at least these tasks
  resp.set_last_task_id(manager_->LastTaskId());
  resp.set_last_event_id(manager_->LastEventId());

  uint64_t active   = 0;
  auto&    by_state = *resp.mutable_tasks_by_state();
  for (const auto& task : manager_->GetTasks()) {
    ++by_state[model::StateName(task.state())];
    if (!model::IsTerminal(task.state())) ++active;
  }
  resp.set_active_tasks(active);
  return resp;
}

} // namespace rtask::service
