#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace keysync::runtime::config {
class LoggingConfig;
}

namespace keysync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "keysync" logger on stderr as the default logger.

  Called first thing in main so that even config errors are logged off
  stdout. KEYSYNC_LOG_LEVEL / KEYSYNC_LOG_PATTERN apply from the start.
  Safe to call again; the existing logger is reused.
*/
void InitializeLogging();

/*
  Applies the config file's level and pattern. Environment variables still
  win. An unknown level name falls back to info with a warning.
*/
void ConfigureLogging(const keysync::runtime::config::LoggingConfig& config);

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

// error-level line carrying kind=<ErrorKind> error=<what()>
void LogFailure(std::string_view message, const std::exception& error);

} // namespace keysync::observability

#define KEYSYNC_LOG_DEBUG(message, ...) ::keysync::observability::LogDebug((message), ##__VA_ARGS__)
#define KEYSYNC_LOG_INFO(message, ...) ::keysync::observability::LogInfo((message), ##__VA_ARGS__)
#define KEYSYNC_LOG_WARN(message, ...) ::keysync::observability::LogWarn((message), ##__VA_ARGS__)
#define KEYSYNC_LOG_ERROR(message, ...) ::keysync::observability::LogError((message), ##__VA_ARGS__)
