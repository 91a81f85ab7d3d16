#include "internal/observability/logging.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace mirrorwatch::observability {
namespace {

constexpr const char* kLoggerName     = "mirrorwatch";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '=' || c == '\\') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
      case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        break;
      case '\t':
        out.push_back(' ');
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out.append(" trace_id=");
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out.append(" span_id=");
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.1f}", value)};
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  std::string lowered;
  lowered.reserve(name.size());
  for (char c : name) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;
  if (lowered == "fatal") return spdlog::level::critical;

  // from_str maps anything it does not know to off.
  const auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off && lowered != "off") return std::nullopt;
  return level;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const mirrorwatch::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::string level_name = "info";
  if (const char* env = Env("MIRRORWATCH_LOG_LEVEL")) {
    level_name = env;
  } else if (!logging.level().empty()) {
    level_name = logging.level();
  }

  std::string pattern = kDefaultPattern;
  if (const char* env = Env("MIRRORWATCH_LOG_PATTERN")) {
    pattern = env;
  } else if (!logging.pattern().empty()) {
    pattern = logging.pattern();
  }

  bool include_trace = logging.include_trace_context();
  if (const char* env = Env("MIRRORWATCH_LOG_INCLUDE_TRACE_CONTEXT")) {
    include_trace = std::string_view(env) == "1" || std::string_view(env) == "true";
  }

  const auto level = ParseLogLevel(level_name);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = include_trace;

  if (!level) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  auto line = FormatLogLine(message, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace mirrorwatch::observability
