#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace keyserver::runtime::config {
class RuntimeConfig;
}

namespace keyserver::observability {

/*
  Structured fields are appended to the message as key=value pairs.
  Values containing spaces, quotes or '=' are double quoted with \" escapes,
  so error texts stay one field.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Rendered in milliseconds with microsecond precision, e.g. "1.250ms".
LogField DurationField(std::string_view key, std::chrono::steady_clock::duration value);

void InitializeLogging(const keyserver::runtime::config::RuntimeConfig& config);
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

} // namespace keyserver::observability

#define KEYSERVER_LOG_DEBUG(message, ...) ::keyserver::observability::LogDebug((message), ##__VA_ARGS__)
#define KEYSERVER_LOG_INFO(message, ...) ::keyserver::observability::LogInfo((message), ##__VA_ARGS__)
#define KEYSERVER_LOG_WARN(message, ...) ::keyserver::observability::LogWarn((message), ##__VA_ARGS__)
#define KEYSERVER_LOG_ERROR(message, ...) ::keyserver::observability::LogError((message), ##__VA_ARGS__)
