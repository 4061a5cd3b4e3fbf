#include "console.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/service/error_code.hpp"
#include "internal/service/task_service.hpp"
#include "internal/util/errors.hpp"
#include "rtask/v1.hpp"

namespace rtask::runtime {

using namespace rtask::v1;

namespace {

constexpr const char* kHelp =
    "add <type> [json-object] | get <id> | cancel <id> | list [state] [--sort=oldest|newest] | "
    "events [task-id] | event <id> | pause | resume | status | types | help | quit";

std::string ToJson(const google::protobuf::Message& message, bool include_defaults = false) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = include_defaults;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize response: " + status.ToString());
  }
  return json;
}

std::string ErrorJson(std::string_view code, std::string_view message) {
  google::protobuf::Struct error;
  auto&                    body = *(*error.mutable_fields())["error"].mutable_struct_value()->mutable_fields();
  body["code"].set_string_value(std::string(code));
  body["message"].set_string_value(std::string(message));
  return ToJson(error);
}

std::string MessageJson(std::string_view message) {
  google::protobuf::Struct reply;
  (*reply.mutable_fields())["message"].set_string_value(std::string(message));
  return ToJson(reply);
}

uint64_t ParseId(const std::string& token, std::string_view what) {
  uint64_t value = 0;
  const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (token.empty() || ec != std::errc() || end != token.data() + token.size() || value == 0) {
    throw util::InvalidArgument(std::string(what) + " must be a positive integer, got '" + token + "'");
  }
  return value;
}

uint64_t RequireId(std::istream& args, std::string_view what) {
  std::string token;
  if (!(args >> token)) {
    throw util::InvalidArgument(std::string(what) + " is required");
  }
  return ParseId(token, what);
}

// Accepts "complete" as well as "TASK_STATE_COMPLETE".
TaskState ParseStateFilter(std::string token) {
  std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (token.rfind("TASK_STATE_", 0) != 0) {
    token = "TASK_STATE_" + token;
  }
  TaskState state = TASK_STATE_UNSPECIFIED;
  if (!TaskState_Parse(token, &state) || state == TASK_STATE_UNSPECIFIED) {
    throw util::InvalidArgument("unknown task state '" + token + "'");
  }
  return state;
}

google::protobuf::Struct ParseFields(const std::string& json) {
  google::protobuf::Struct fields;
  if (json.find_first_not_of(" \t") == std::string::npos) {
    return fields;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &fields);
  if (!status.ok()) {
    throw util::InvalidArgument("task fields must be a JSON object: " + status.ToString());
  }
  return fields;
}

} // namespace

Console::Console(std::shared_ptr<rtask::service::TaskService> service) : service_(std::move(service)) {
}

std::string Console::Execute(const std::string& line, bool* quit) {
  std::istringstream args(line);
  std::string        command;
  if (!(args >> command)) {
    return {};
  }

  try {
    return Dispatch(command, args, quit);
  } catch (const std::exception& e) {
    return ErrorJson(rtask::service::ErrorCodeName(rtask::service::ToErrorCode(e)), e.what());
  }
}

std::string Console::Dispatch(const std::string& command, std::istream& args, bool* quit) {
  if (command == "add") {
    AddTaskRequest req;
    std::string    type;
    if (!(args >> type)) {
      throw util::InvalidArgument("task type is required");
    }
    std::string rest;
    std::getline(args, rest);
    req.set_type(type);
    *req.mutable_fields() = ParseFields(rest);
    return ToJson(service_->AddTask(req));
  }

  if (command == "get") {
    GetTaskRequest req;
    req.set_id(RequireId(args, "task id"));
    return ToJson(service_->GetTask(req));
  }

  if (command == "cancel") {
    CancelTaskRequest req;
    req.set_id(RequireId(args, "task id"));
    return ToJson(service_->CancelTask(req));
  }

  if (command == "list") {
    ListTasksRequest req;
    std::string      token;
    while (args >> token) {
      if (token == "--sort=oldest") {
        req.set_sort(SORT_ORDER_OLDEST_FIRST);
      } else if (token == "--sort=newest") {
        req.set_sort(SORT_ORDER_NEWEST_FIRST);
      } else if (token.rfind("--", 0) == 0) {
        throw util::InvalidArgument("unknown option '" + token + "'");
      } else {
        req.set_state(ParseStateFilter(token));
      }
    }
    return ToJson(service_->ListTasks(req));
  }

  if (command == "events") {
    ListEventsRequest req;
    std::string       token;
    if (args >> token) {
      req.set_task(ParseId(token, "task id"));
    }
    return ToJson(service_->ListEvents(req));
  }

  if (command == "event") {
    GetEventRequest req;
    req.set_id(RequireId(args, "event id"));
    return ToJson(service_->GetEvent(req));
  }

  if (command == "pause") {
    return ToJson(service_->Pause(), true);
  }
  if (command == "resume") {
    return ToJson(service_->Resume(), true);
  }
  if (command == "status") {
    return ToJson(service_->Status(), true);
  }
  if (command == "types") {
    return ToJson(service_->ListTaskTypes());
  }
  if (command == "help") {
    return MessageJson(kHelp);
  }
  if (command == "quit" || command == "exit") {
    if (quit) *quit = true;
    return MessageJson("bye");
  }

  throw util::InvalidArgument("unknown command '" + command + "'");
}

void Console::Run(std::istream& in, std::ostream& out, const std::function<bool()>& keep_running) {
  std::string line;
  bool        quit = false;
  while (!quit && keep_running() && std::getline(in, line)) {
    auto response = Execute(line, &quit);
    if (response.empty()) continue;
    out << response << std::endl;
  }
  RTASK_LOG_DEBUG("Console stopped", {observability::BoolField("quit", quit)});
}

} // namespace rtask::runtime
