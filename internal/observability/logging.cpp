#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace bridgewatch::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment beats the YAML file, which beats the built-in default.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) || c == '"' || c == '='; });
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out.append("\\n");
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  return "trace_id=" + std::string(trace_id, sizeof(trace_id)) + " span_id=" + std::string(span_id, sizeof(span_id));
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

LogField DoubleField(std::string_view key, double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "warning") lowered = "warn";
  if (lowered == "error") lowered = "err";

  // from_str maps anything it does not know to off
  const auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off && lowered != "off") {
    throw std::invalid_argument("unknown log level '" + std::string(name) + "'");
  }
  return level;
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  return line;
}

void InitializeLogging(const bridgewatch::runtime::config::RuntimeConfig& config, const std::string& logger_name) {
  const auto level = ParseLevel(Resolve("BRIDGEWATCH_LOG_LEVEL", config.logging().level(), "info"));

  auto logger = spdlog::get(logger_name);
  if (!logger) {
    logger = spdlog::stdout_color_mt(logger_name);
  }
  logger->set_pattern(Resolve("BRIDGEWATCH_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (const char* include_trace = std::getenv("BRIDGEWATCH_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    g_include_trace_context = config.logging().include_trace_context();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto line         = FormatLine(message, fields);
  auto trace_fields = TraceContextFields();
  if (!trace_fields.empty()) {
    line.push_back(' ');
    line.append(trace_fields);
  }
  spdlog::log(level, "{}", line);
}

} // namespace bridgewatch::observability
