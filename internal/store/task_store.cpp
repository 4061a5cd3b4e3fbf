#include "task_store.hpp"

#include <algorithm>
#include <string>

#include "internal/model/task_changes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rtask::store {

using rtask::v1::Event;
using rtask::v1::Task;
using rtask::v1::TaskState;

Task TaskStore::AddTask(Task draft) {
  const auto initial = model::StateChange(rtask::v1::TASK_STATE_NEW);

  std::lock_guard lock(mutex_);

  const uint64_t task_id = state_.last_task_id + 1;
  draft.set_id(task_id);
  draft.set_update(0);
  draft.set_state(rtask::v1::TASK_STATE_UNSPECIFIED);

  auto& task          = state_.tasks[task_id];
  task                = std::move(draft);
  state_.last_task_id = task_id;

  UpdateLocked(task, initial);
  return task;
}

Task TaskStore::UpdateTask(uint64_t id, const google::protobuf::Struct& changes) {
  model::ValidateChanges(changes);

  std::lock_guard lock(mutex_);
  auto            it = state_.tasks.find(id);
  if (it == state_.tasks.end()) {
    throw util::NotFound("task " + std::to_string(id) + " not found");
  }
  return UpdateLocked(it->second, changes);
}

std::optional<Task> TaskStore::TransitionTask(uint64_t id, std::initializer_list<TaskState> allowed_from,
                                              const google::protobuf::Struct& changes) {
  model::ValidateChanges(changes);

  std::lock_guard lock(mutex_);
  auto            it = state_.tasks.find(id);
  if (it == state_.tasks.end()) {
    throw util::NotFound("task " + std::to_string(id) + " not found");
  }

  const auto current = it->second.state();
  if (std::find(allowed_from.begin(), allowed_from.end(), current) == allowed_from.end()) {
    return std::nullopt;
  }
  return UpdateLocked(it->second, changes);
}

Task TaskStore::UpdateLocked(Task& task, const google::protobuf::Struct& changes) {
  Task original = task;

  const uint64_t event_id = AddEventLocked(task.id(), changes);

  model::ApplyChanges(changes, &task);
  task.set_update(event_id);
  return original;
}

uint64_t TaskStore::AddEventLocked(uint64_t task_id, const google::protobuf::Struct& changes) {
  const uint64_t event_id = state_.last_event_id + 1;

  Event event;
  event.set_id(event_id);
  event.set_task(task_id);
  event.set_created_ms(util::NowMillis());
  *event.mutable_changed() = changes;
  for (auto& error : model::ErrorsOf(changes)) {
    event.add_errors(std::move(error));
  }

  state_.events.emplace(event_id, std::move(event));
  state_.events_by_task[task_id].push_back(event_id);
  state_.last_event_id = event_id;
  return event_id;
}

std::optional<Task> TaskStore::GetTask(uint64_t id) const {
  std::lock_guard lock(mutex_);
  auto            it = state_.tasks.find(id);
  if (it == state_.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<Task> TaskStore::GetTasks() const {
  std::lock_guard   lock(mutex_);
  std::vector<Task> tasks;
  tasks.reserve(state_.tasks.size());
  for (const auto& [_, task] : state_.tasks) {
    tasks.push_back(task);
  }
  return tasks;
}

std::optional<Event> TaskStore::GetEvent(uint64_t id) const {
  std::lock_guard lock(mutex_);
  auto            it = state_.events.find(id);
  if (it == state_.events.end()) return std::nullopt;
  return it->second;
}

std::vector<Event> TaskStore::GetEvents() const {
  std::lock_guard    lock(mutex_);
  std::vector<Event> events;
  events.reserve(state_.events.size());
  for (const auto& [_, event] : state_.events) {
    events.push_back(event);
  }
  return events;
}

std::vector<Event> TaskStore::GetTaskEvents(uint64_t task_id) const {
  std::lock_guard    lock(mutex_);
  std::vector<Event> events;
  auto               it = state_.events_by_task.find(task_id);
  if (it == state_.events_by_task.end()) return events;

  events.reserve(it->second.size());
  for (const auto event_id : it->second) {
    events.push_back(state_.events.at(event_id));
  }
  return events;
}

uint64_t TaskStore::LastTaskId() const {
  std::lock_guard lock(mutex_);
  return state_.last_task_id;
}

uint64_t TaskStore::LastEventId() const {
  std::lock_guard lock(mutex_);
  return state_.last_event_id;
}

} // namespace rtask::store
