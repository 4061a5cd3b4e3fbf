#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "rtask/v1/task.pb.h"

namespace rtask::observability {
namespace {

constexpr const char* kLoggerName     = "rtask";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string FirstSet(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps every unknown name to `off`
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("Invalid log level '" + name + "'");
  }
  return level;
}

// TASK_STATE_PROCESSING -> PROCESSING
std::string_view StripPrefix(std::string_view name, std::string_view prefix) {
  if (name.substr(0, prefix.size()) == prefix) {
    name.remove_prefix(prefix.size());
  }
  return name;
}

void AppendFields(fmt::memory_buffer& out, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(out), " {}={}", field.key, field.value);
  }
}

void Emit(spdlog::level::level_enum level, const fmt::memory_buffer& record) {
  spdlog::log(level, "{}", std::string_view(record.data(), record.size()));
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField TaskIdField(std::uint64_t task_id) {
  return {"task_id", std::to_string(task_id)};
}

void InitializeLogging(const rtask::runtime::config::LoggingConfig& config) {
  const auto level   = ParseLevel(FirstSet("RTASK_LOG_LEVEL", config.level(), kDefaultLevel));
  const auto pattern = FirstSet("RTASK_LOG_PATTERN", config.pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  fmt::memory_buffer record;
  record.append(message.data(), message.data() + message.size());
  AppendFields(record, fields);
  Emit(level, record);
}

void LogTask(spdlog::level::level_enum level, std::string_view message, const rtask::v1::Task& task,
             std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  fmt::memory_buffer record;
  fmt::format_to(std::back_inserter(record), "{} task_id={} type={} state={} affinity={}", message, task.id(), task.type(),
                 StripPrefix(rtask::v1::TaskState_Name(task.state()), "TASK_STATE_"),
                 StripPrefix(rtask::v1::Affinity_Name(task.affinity()), "AFFINITY_"));
  AppendFields(record, fields);
  Emit(level, record);
}

} // namespace rtask::observability
