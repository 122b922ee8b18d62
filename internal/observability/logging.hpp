#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace localdeck::runtime::config {
class RuntimeConfig;
}

namespace localdeck::observability {

// key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process-wide "localdeck" logger.

  Environment overrides take precedence over the config:
    LOCALDECK_LOG_LEVEL, LOCALDECK_LOG_PATTERN, LOCALDECK_LOG_INCLUDE_TRACE_CONTEXT
*/
void InitializeLogging(const localdeck::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace localdeck::observability

#define LOCALDECK_LOG_DEBUG(message, ...) ::localdeck::observability::LogDebug((message), ##__VA_ARGS__)
#define LOCALDECK_LOG_INFO(message, ...) ::localdeck::observability::LogInfo((message), ##__VA_ARGS__)
#define LOCALDECK_LOG_WARN(message, ...) ::localdeck::observability::LogWarn((message), ##__VA_ARGS__)
#define LOCALDECK_LOG_ERROR(message, ...) ::localdeck::observability::LogError((message), ##__VA_ARGS__)
