#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bridgewatch::runtime::config {
class RuntimeConfig;
}

namespace bridgewatch::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value, int precision = 4);
LogField BoolField(std::string_view key, bool value);

// Accepts spdlog level names case-insensitively, plus "warning" and "error".
// Throws std::invalid_argument for anything else.
spdlog::level::level_enum ParseLevel(std::string_view name);

// "message key=value ..."; values with spaces, quotes or '=' are quoted.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

// Installs the default spdlog logger, named after the running process.
// BRIDGEWATCH_LOG_LEVEL / BRIDGEWATCH_LOG_PATTERN override the config.
void InitializeLogging(const bridgewatch::runtime::config::RuntimeConfig& config, const std::string& logger_name);
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

} // namespace bridgewatch::observability

#define BRIDGEWATCH_LOG_DEBUG(message, ...) ::bridgewatch::observability::LogDebug((message), ##__VA_ARGS__)
#define BRIDGEWATCH_LOG_INFO(message, ...) ::bridgewatch::observability::LogInfo((message), ##__VA_ARGS__)
#define BRIDGEWATCH_LOG_WARN(message, ...) ::bridgewatch::observability::LogWarn((message), ##__VA_ARGS__)
#define BRIDGEWATCH_LOG_ERROR(message, ...) ::bridgewatch::observability::LogError((message), ##__VA_ARGS__)
