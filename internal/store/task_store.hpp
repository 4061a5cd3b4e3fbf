#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "rtask/v1/task.pb.h"

namespace rtask::store {

/*
  In-memory task table and event log.

  CRITICAL GUARANTEES:

  - Every mutation runs under one mutex; ID assignment, event append and
    task merge are indivisible.
  - Task ids and event ids are separate counters starting at 1, with no
    gaps and no reuse.
  - A task only changes through an event. Task.update is the id of the
    last event written for it.
  - Tasks and events are never removed.

  Reads return copies.
*/
class TaskStore {
 public:
  TaskStore() = default;

  TaskStore(const TaskStore&)            = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  // Assigns the task id and writes the initial TASK_STATE_NEW event.
  // The draft's id, update and state are overwritten.
  rtask::v1::Task AddTask(rtask::v1::Task draft);

  // Appends an event for `changes` and merges them into the task.
  // Returns the task as it was before the update.
  // Throws util::NotFound for an unknown id, util::InvalidArgument for a
  // change set that touches a creation field or carries malformed values.
  rtask::v1::Task UpdateTask(uint64_t id, const google::protobuf::Struct& changes);

  // UpdateTask applied only when the current state is one of `allowed_from`.
  // Returns the prior task when the update happened, nullopt otherwise.
  std::optional<rtask::v1::Task> TransitionTask(uint64_t id, std::initializer_list<rtask::v1::TaskState> allowed_from,
                                                const google::protobuf::Struct& changes);

  std::optional<rtask::v1::Task> GetTask(uint64_t id) const;
  std::vector<rtask::v1::Task>   GetTasks() const;

  std::optional<rtask::v1::Event> GetEvent(uint64_t id) const;
  std::vector<rtask::v1::Event>   GetEvents() const;

  // Events of one task in id order.
  std::vector<rtask::v1::Event> GetTaskEvents(uint64_t task_id) const;

  uint64_t LastTaskId() const;
  uint64_t LastEventId() const;

 private:
  struct State {
    std::map<uint64_t, rtask::v1::Task>                   tasks;
    std::map<uint64_t, rtask::v1::Event>                  events;
    std::unordered_map<uint64_t, std::vector<uint64_t>> events_by_task;

    uint64_t last_task_id  = 0;
    uint64_t last_event_id = 0;
  };

  // Only called while mutex_ is held.
  uint64_t        AddEventLocked(uint64_t task_id, const google::protobuf::Struct& changes);
  rtask::v1::Task UpdateLocked(rtask::v1::Task& task, const google::protobuf::Struct& changes);

  mutable std::mutex mutex_;
  State              state_;
};

} // namespace rtask::store
