#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fetchgate::runtime::config {
class LoggingConfig;
}

namespace fetchgate::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the process wide logger. The server and the agent each pass their
// own logger name.
void InitializeLogging(const fetchgate::runtime::config::LoggingConfig& config, std::string_view logger_name);
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

} // namespace fetchgate::observability

#define FETCHGATE_LOG_DEBUG(message, ...) ::fetchgate::observability::LogDebug((message), ##__VA_ARGS__)
#define FETCHGATE_LOG_INFO(message, ...) ::fetchgate::observability::LogInfo((message), ##__VA_ARGS__)
#define FETCHGATE_LOG_WARN(message, ...) ::fetchgate::observability::LogWarn((message), ##__VA_ARGS__)
#define FETCHGATE_LOG_ERROR(message, ...) ::fetchgate::observability::LogError((message), ##__VA_ARGS__)
