#include "internal/observability/logging.hpp"

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

namespace replication::observability {
namespace {

constexpr const char* kLoggerName     = "replication-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// env first, then config, then fallback
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendValue(std::string* out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out->append(value);
    return;
  }
  out->push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out->push_back('\\');
    if (c == '\n') {
      out->append("\\n");
      continue;
    }
    out->push_back(c);
  }
  out->push_back('"');
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

void AppendTraceContext(std::string* line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line->append(" trace_id=").append(HexId(trace_bytes, 16));
  line->append(" span_id=").append(HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string*) {
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

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key).push_back('=');
    AppendValue(&out, field.value);
  }
  return out;
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

void InitializeLogging(const replication::runtime::config::RuntimeConfig& config) {
  const auto level   = Resolve("REPLICATION_LOG_LEVEL", config.logging().level(), "info");
  const auto pattern = Resolve("REPLICATION_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);
  const auto parsed  = ParseLevel(level);

  // may be called again by embedders that reload config
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(parsed);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (const char* include_trace = std::getenv("REPLICATION_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    g_include_trace_context = config.logging().include_trace_context();
  }

  if (parsed == spdlog::level::info && level != "info") {
    LogWarn("Unknown log level, using info", {StringField("level", level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  AppendTraceContext(&line);
  logger->log(level, "{}", line);
}

} // namespace replication::observability
