#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rtask::runtime::config {
class LoggingConfig;
}
namespace rtask::v1 {
class Task;
}

namespace rtask::observability {

/*
  Structured logging on top of spdlog.

  A record is a message followed by key=value fields:

    Task cancelled task_id=7 type=move state=PROCESSING affinity=SERIAL

  Task records always carry the same four task fields in that order so the
  engine's logs can be grepped by task id or type.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// For ids of tasks that could not be loaded.
LogField TaskIdField(std::uint64_t task_id);

// Level and pattern come from RTASK_LOG_LEVEL / RTASK_LOG_PATTERN, then the
// config, then defaults. Throws std::runtime_error for an unknown level.
// Logs go to stderr; stdout belongs to the operator console.
void InitializeLogging(const rtask::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Log() with task_id, type, state and affinity ahead of `fields`.
void LogTask(spdlog::level::level_enum level, std::string_view message, const rtask::v1::Task& task,
             std::initializer_list<LogField> fields = {});

} // namespace rtask::observability

#define RTASK_LOG_DEBUG(message, ...) ::rtask::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define RTASK_LOG_INFO(message, ...) ::rtask::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define RTASK_LOG_WARN(message, ...) ::rtask::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define RTASK_LOG_ERROR(message, ...) ::rtask::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)

#define RTASK_LOG_TASK_DEBUG(message, task, ...) ::rtask::observability::LogTask(::spdlog::level::debug, (message), (task), ##__VA_ARGS__)
#define RTASK_LOG_TASK_INFO(message, task, ...) ::rtask::observability::LogTask(::spdlog::level::info, (message), (task), ##__VA_ARGS__)
#define RTASK_LOG_TASK_WARN(message, task, ...) ::rtask::observability::LogTask(::spdlog::level::warn, (message), (task), ##__VA_ARGS__)
#define RTASK_LOG_TASK_ERROR(message, task, ...) ::rtask::observability::LogTask(::spdlog::level::err, (message), (task), ##__VA_ARGS__)
