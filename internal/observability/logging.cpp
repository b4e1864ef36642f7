#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/error_kind.hpp"

namespace keysync::observability {
namespace {

constexpr const char* kLoggerName     = "keysync";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  if (!configured.empty()) {
    return configured;
  }
  return fallback;
}

std::shared_ptr<spdlog::logger> KeysyncLogger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  // stdout stays free for --help output
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  return logger;
}

void Apply(const std::string& level_name, const std::string& pattern) {
  auto logger = KeysyncLogger();
  logger->set_pattern(pattern);

  // from_str maps every unknown name to off
  const auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    logger->set_level(spdlog::level::info);
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
    return;
  }
  logger->set_level(level);
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

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

void InitializeLogging() {
  Apply(Resolve("KEYSYNC_LOG_LEVEL", {}, kDefaultLevel), Resolve("KEYSYNC_LOG_PATTERN", {}, kDefaultPattern));
}

void ConfigureLogging(const keysync::runtime::config::LoggingConfig& config) {
  Apply(Resolve("KEYSYNC_LOG_LEVEL", config.level(), kDefaultLevel),
        Resolve("KEYSYNC_LOG_PATTERN", config.pattern(), kDefaultPattern));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

void LogFailure(std::string_view message, const std::exception& error) {
  LogError(message, {StringField("kind", util::ErrorKind(error)), StringField("error", error.what())});
}

} // namespace keysync::observability
