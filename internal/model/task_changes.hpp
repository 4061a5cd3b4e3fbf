#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "rtask/v1/task.pb.h"

namespace rtask::model {

/*
  A change set is the `changed` map of an event: field name -> new value.

  Known fields:
    state   string, a TaskState name
    result  any value
    errors  list of strings, only together with state TASK_STATE_FAILED
  Every other key is written into Task.fields.

  id, type, created_ms, update and affinity are fixed at creation and cannot
  appear in a change set.
*/

inline constexpr std::string_view kStateField  = "state";
inline constexpr std::string_view kResultField = "result";
inline constexpr std::string_view kErrorsField = "errors";

bool IsImmutableField(std::string_view field);

// Throws util::InvalidArgument when a key or value is not acceptable.
void ValidateChanges(const google::protobuf::Struct& changes);

// Merges a validated change set into the task. Does not touch `update`.
void ApplyChanges(const google::protobuf::Struct& changes, rtask::v1::Task* task);

std::vector<std::string> ErrorsOf(const google::protobuf::Struct& changes);

google::protobuf::Struct StateChange(rtask::v1::TaskState state);
google::protobuf::Struct CompleteChange(const google::protobuf::Value& result);
google::protobuf::Struct FailedChange(const std::vector<std::string>& errors);

std::string StateName(rtask::v1::TaskState state);

} // namespace rtask::model
