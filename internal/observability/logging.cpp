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

namespace practicedb::observability {
namespace {

constexpr const char* kLoggerName     = "practicedb";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

thread_local std::vector<LogField> t_context;
bool                               g_include_trace_context{false};

spdlog::level::level_enum ResolveLevel(const practicedb::runtime::config::RuntimeConfig& config) {
  std::string name = config.logging().level().empty() ? "info" : config.logging().level();
  if (const char* level = std::getenv("PRACTICEDB_LOG_LEVEL")) {
    name = level;
  }

  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off.
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

void AppendField(std::string& out, const LogField& field) {
  out += ' ';
  out += field.key;
  out += '=';
  AppendValue(out, field.value);
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

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, {"trace_id", HexId(trace_bytes, 16)});
  AppendField(out, {"span_id", HexId(span_bytes, 8)});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField CountField(std::string_view key, std::size_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField CollectionField(std::string_view collection) {
  return StringField("collection", collection);
}

LogField DocumentField(std::string_view id) {
  return StringField("document", id);
}

LogField TransactionField(std::string_view id) {
  return StringField("transaction", id);
}

LogField ErrorField(const std::exception& error) {
  return StringField("error", error.what());
}

LogContext::LogContext(std::initializer_list<LogField> fields) : pushed_(fields.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(t_context.size() - pushed_);
}

std::vector<LogField> CurrentLogContext() {
  return t_context;
}

void InitializeLogging(const practicedb::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern());
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = config.logging().include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  for (const auto& field : t_context) AppendField(line, field);
  AppendTraceContext(line);
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;
  spdlog::log(level, "{}", FormatLogLine(message, fields));
}

} // namespace practicedb::observability
