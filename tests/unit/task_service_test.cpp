#include "internal/service/task_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <google/protobuf/util/json_util.h>

#include "internal/core/task_manager.hpp"
#include "internal/handlers/builtin_handlers.hpp"
#include "internal/runtime/console.hpp"
#include "internal/util/errors.hpp"

namespace {

using rtask::core::TaskManager;
using rtask::runtime::Console;
using rtask::service::TaskService;

// No workers are started, so tasks stay where the test puts them.
std::shared_ptr<TaskManager> BuildIdleManager() {
  auto manager = std::make_shared<TaskManager>();
  rtask::handlers::RegisterBuiltinTaskTypes(*manager);
  return manager;
}

rtask::v1::Task AddEcho(TaskService& service) {
  rtask::v1::AddTaskRequest req;
  req.set_type("echo");
  auto task = service.AddTask(req);
  // distinct creation times for the sort checks
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  return task;
}

template <typename Message>
Message ParseJson(const std::string& json) {
  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message);
  assert(status.ok());
  return message;
}

std::string ErrorCodeOf(const std::string& json) {
  auto reply = ParseJson<google::protobuf::Struct>(json);
  return reply.fields().at("error").struct_value().fields().at("code").string_value();
}

void TestListFiltersAndSorts() {
  auto        manager = BuildIdleManager();
  TaskService service(manager);

  AddEcho(service);
  AddEcho(service);
  AddEcho(service);

  rtask::v1::CancelTaskRequest cancel;
  cancel.set_id(2);
  const auto cancelled = service.CancelTask(cancel);
  assert(cancelled.state() == rtask::v1::TASK_STATE_CANCELLED);

  rtask::v1::ListTasksRequest all;
  auto                        unsorted = service.ListTasks(all);
  assert(unsorted.tasks_size() == 3);
  assert(unsorted.tasks(0).id() == 1);

  rtask::v1::ListTasksRequest newest;
  newest.set_sort(rtask::v1::SORT_ORDER_NEWEST_FIRST);
  auto sorted = service.ListTasks(newest);
  assert(sorted.tasks(0).id() == 3);
  assert(sorted.tasks(1).id() == 2);
  assert(sorted.tasks(2).id() == 1);

  rtask::v1::ListTasksRequest oldest;
  oldest.set_sort(rtask::v1::SORT_ORDER_OLDEST_FIRST);
  assert(service.ListTasks(oldest).tasks(0).id() == 1);

  rtask::v1::ListTasksRequest only_new;
  only_new.set_state(rtask::v1::TASK_STATE_NEW);
  only_new.set_sort(rtask::v1::SORT_ORDER_NEWEST_FIRST);
  auto filtered = service.ListTasks(only_new);
  assert(filtered.tasks_size() == 2);
  assert(filtered.tasks(0).id() == 3);
  assert(filtered.tasks(1).id() == 1);
}

void TestLookupsAndEvents() {
  auto        manager = BuildIdleManager();
  TaskService service(manager);
  AddEcho(service);
  AddEcho(service);

  rtask::v1::GetTaskRequest get;
  get.set_id(2);
  assert(service.GetTask(get).type() == "echo");

  get.set_id(7);
  bool not_found = false;
  try {
    service.GetTask(get);
  } catch (const rtask::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  rtask::v1::ListEventsRequest all_events;
  assert(service.ListEvents(all_events).events_size() == 2);

  rtask::v1::ListEventsRequest task_events;
  task_events.set_task(2);
  auto events = service.ListEvents(task_events);
  assert(events.events_size() == 1);
  assert(events.events(0).id() == 2);

  rtask::v1::GetEventRequest event;
  event.set_id(1);
  assert(service.GetEvent(event).task() == 1);

  rtask::v1::AddTaskRequest untyped;
  bool                      invalid = false;
  try {
    service.AddTask(untyped);
  } catch (const rtask::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);
}

void TestStatusCountsTasks() {
  auto        manager = BuildIdleManager();
  TaskService service(manager);
  AddEcho(service);
  AddEcho(service);

  rtask::v1::CancelTaskRequest cancel;
  cancel.set_id(1);
  service.CancelTask(cancel);

  auto status = service.Pause();
  assert(status.paused());
  assert(status.last_task_id() == 2);
  assert(status.last_event_id() == 3);
  assert(status.active_tasks() == 1);
  assert(status.tasks_by_state().at("TASK_STATE_NEW") == 1);
  assert(status.tasks_by_state().at("TASK_STATE_CANCELLED") == 1);

  assert(!service.Resume().paused());

  auto types = service.ListTaskTypes();
  assert(types.types_size() == 2);
  assert(types.types(0).type() == "echo");
  assert(types.types(0).affinity() == rtask::v1::AFFINITY_SERIAL);
  assert(types.types(1).type() == "sleep");
  assert(types.types(1).affinity() == rtask::v1::AFFINITY_PARALLEL);
}

void TestConsoleCommands() {
  auto    manager = BuildIdleManager();
  Console console(std::make_shared<TaskService>(manager));

  auto added = ParseJson<rtask::v1::Task>(console.Execute(R"(add echo {"pose": "home"})"));
  assert(added.id() == 1);
  assert(added.state() == rtask::v1::TASK_STATE_NEW);
  assert(added.fields().fields().at("pose").string_value() == "home");

  auto fetched = ParseJson<rtask::v1::Task>(console.Execute("get 1"));
  assert(fetched.type() == "echo");

  auto cancelled = ParseJson<rtask::v1::Task>(console.Execute("cancel 1"));
  assert(cancelled.state() == rtask::v1::TASK_STATE_CANCELLED);

  auto listed = ParseJson<rtask::v1::ListTasksResponse>(console.Execute("list cancelled --sort=newest"));
  assert(listed.tasks_size() == 1);
  auto none = ParseJson<rtask::v1::ListTasksResponse>(console.Execute("list TASK_STATE_NEW"));
  assert(none.tasks_size() == 0);

  auto events = ParseJson<rtask::v1::ListEventsResponse>(console.Execute("events 1"));
  assert(events.events_size() == 2);
  auto event = ParseJson<rtask::v1::Event>(console.Execute("event 2"));
  assert(event.changed().fields().at("state").string_value() == "TASK_STATE_CANCELLED");

  auto status = ParseJson<rtask::v1::StatusResponse>(console.Execute("pause"));
  assert(status.paused());
  status = ParseJson<rtask::v1::StatusResponse>(console.Execute("status"));
  assert(status.paused());
  assert(status.active_tasks() == 0);

  assert(console.Execute("   ").empty());

  bool quit = false;
  console.Execute("help", &quit);
  assert(!quit);
  console.Execute("quit", &quit);
  assert(quit);
}

void TestConsoleReportsErrors() {
  auto    manager = BuildIdleManager();
  Console console(std::make_shared<TaskService>(manager));
  console.Execute("add echo");

  assert(ErrorCodeOf(console.Execute("get 99")) == "not_found");
  assert(ErrorCodeOf(console.Execute("get abc")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("get")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("add ghost")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("add echo [1, 2]")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("list sleeping")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("list --sort=random")) == "invalid_argument");
  assert(ErrorCodeOf(console.Execute("frobnicate")) == "invalid_argument");

  console.Execute("cancel 1");
  assert(ErrorCodeOf(console.Execute("cancel 1")) == "failed_precondition");
  assert(ErrorCodeOf(console.Execute("cancel 5")) == "not_found");

  // failed commands never create tasks
  assert(manager->LastTaskId() == 1);
}

void TestConsoleRunStopsAtQuit() {
  auto    manager = BuildIdleManager();
  Console console(std::make_shared<TaskService>(manager));

  std::istringstream in("add echo\n\nstatus\nquit\nadd echo\n");
  std::ostringstream out;
  console.Run(in, out, [] { return true; });

  std::istringstream lines(out.str());
  std::string        line;
  int                count = 0;
  while (std::getline(lines, line)) ++count;
  assert(count == 3);
  assert(manager->LastTaskId() == 1);
}

} // namespace

int main() {
  TestListFiltersAndSorts();
  TestLookupsAndEvents();
  TestStatusCountsTasks();
  TestConsoleCommands();
  TestConsoleReportsErrors();
  TestConsoleRunStopsAtQuit();

  std::cout << "rtask_unit_task_service: pass\n";
  return 0;
}
