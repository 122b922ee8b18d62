#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace localdeck::observability {
namespace {

constexpr const char* kLoggerName     = "localdeck";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  std::string level;
  std::string pattern;
  bool        include_trace_context{false};
};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

LogSettings ResolveSettings(const localdeck::runtime::config::RuntimeConfig& config) {
  LogSettings settings;
  settings.level   = EnvOr("LOCALDECK_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  settings.pattern = EnvOr("LOCALDECK_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  if (const char* include_trace = std::getenv("LOCALDECK_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  } else {
    settings.include_trace_context = config.logging().include_trace_context();
  }
  return settings;
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

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

void InitializeLogging(const localdeck::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);

  const auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    line += ' ';
    line += serialized_fields;
  }

  const auto trace_fields = TraceContextFields();
  if (!trace_fields.empty()) {
    line += ' ';
    line += trace_fields;
  }

  spdlog::log(level, "{}", line);
}

} // namespace localdeck::observability
