#include "task_changes.hpp"

#include <array>

#include "internal/util/errors.hpp"

namespace rtask::model {

using rtask::v1::Task;
using rtask::v1::TaskState;

namespace {

constexpr std::array<std::string_view, 5> kImmutableFields = {"id", "type", "created_ms", "update", "affinity"};

TaskState ParseState(const google::protobuf::Value& value) {
  TaskState state = rtask::v1::TASK_STATE_UNSPECIFIED;
  if (value.kind_case() != google::protobuf::Value::kStringValue || !rtask::v1::TaskState_Parse(value.string_value(), &state) ||
      state == rtask::v1::TASK_STATE_UNSPECIFIED) {
    throw util::InvalidArgument("state must name a task state");
  }
  return state;
}

void CheckErrors(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    throw util::InvalidArgument("errors must be a list of strings");
  }
  for (const auto& item : value.list_value().values()) {
    if (item.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::InvalidArgument("errors must be a list of strings");
    }
  }
}

} // namespace

bool IsImmutableField(std::string_view field) {
  for (const auto immutable : kImmutableFields) {
    if (field == immutable) return true;
  }
  return false;
}

void ValidateChanges(const google::protobuf::Struct& changes) {
  if (changes.fields().empty()) {
    throw util::InvalidArgument("change set is empty");
  }
  TaskState state      = rtask::v1::TASK_STATE_UNSPECIFIED;
  bool      has_errors = false;
  for (const auto& [key, value] : changes.fields()) {
    if (key.empty()) {
      throw util::InvalidArgument("change set has an empty field name");
    }
    if (IsImmutableField(key)) {
      throw util::InvalidArgument("field '" + key + "' cannot be changed after creation");
    }
    if (key == kStateField) {
      state = ParseState(value);
    } else if (key == kErrorsField) {
      CheckErrors(value);
      has_errors = true;
    }
  }

  // errors only travel with a failure
  if (has_errors && state != rtask::v1::TASK_STATE_FAILED) {
    throw util::InvalidArgument("errors can only be recorded with state TASK_STATE_FAILED");
  }
}

void ApplyChanges(const google::protobuf::Struct& changes, Task* task) {
  for (const auto& [key, value] : changes.fields()) {
    if (key == kStateField) {
      task->set_state(ParseState(value));
    } else if (key == kResultField) {
      *task->mutable_result() = value;
    } else if (key == kErrorsField) {
      task->clear_errors();
      for (const auto& item : value.list_value().values()) {
        task->add_errors(item.string_value());
      }
    } else {
      (*task->mutable_fields()->mutable_fields())[key] = value;
    }
  }
}

std::vector<std::string> ErrorsOf(const google::protobuf::Struct& changes) {
  std::vector<std::string> errors;
  auto                     it = changes.fields().find(std::string(kErrorsField));
  if (it == changes.fields().end() || it->second.kind_case() != google::protobuf::Value::kListValue) {
    return errors;
  }
  for (const auto& item : it->second.list_value().values()) {
    errors.push_back(item.string_value());
  }
  return errors;
}

google::protobuf::Struct StateChange(TaskState state) {
  google::protobuf::Struct changes;
  (*changes.mutable_fields())[std::string(kStateField)].set_string_value(StateName(state));
  return changes;
}

google::protobuf::Struct CompleteChange(const google::protobuf::Value& result) {
  auto changes                                         = StateChange(rtask::v1::TASK_STATE_COMPLETE);
  (*changes.mutable_fields())[std::string(kResultField)] = result;
  return changes;
}

google::protobuf::Struct FailedChange(const std::vector<std::string>& errors) {
  auto  changes = StateChange(rtask::v1::TASK_STATE_FAILED);
  auto* list    = (*changes.mutable_fields())[std::string(kErrorsField)].mutable_list_value();
  for (const auto& error : errors) {
    list->add_values()->set_string_value(error);
  }
  return changes;
}

std::string StateName(TaskState state) {
  return rtask::v1::TaskState_Name(state);
}

} // namespace rtask::model
