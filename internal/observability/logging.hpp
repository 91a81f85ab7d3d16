#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace mirrorwatch::runtime::config {
class RuntimeConfig;
}

namespace mirrorwatch::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// "warning" is accepted for warn. Unknown names yield nullopt.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

/*
  Renders `message key=value ...`. Values that are empty or contain
  whitespace, quotes or '=' are double-quoted with '"' and '\' escaped and
  newlines folded, so one event stays on one line (probe error messages and
  HTTP bodies routinely carry all of these).
*/
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

// MIRRORWATCH_LOG_LEVEL, MIRRORWATCH_LOG_PATTERN and
// MIRRORWATCH_LOG_INCLUDE_TRACE_CONTEXT override the logging section.
void InitializeLogging(const mirrorwatch::runtime::config::RuntimeConfig& config);
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

} // namespace mirrorwatch::observability

#define MIRRORWATCH_LOG_DEBUG(message, ...) ::mirrorwatch::observability::LogDebug((message), ##__VA_ARGS__)
#define MIRRORWATCH_LOG_INFO(message, ...) ::mirrorwatch::observability::LogInfo((message), ##__VA_ARGS__)
#define MIRRORWATCH_LOG_WARN(message, ...) ::mirrorwatch::observability::LogWarn((message), ##__VA_ARGS__)
#define MIRRORWATCH_LOG_ERROR(message, ...) ::mirrorwatch::observability::LogError((message), ##__VA_ARGS__)
