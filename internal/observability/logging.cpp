#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace cms::observability {
namespace {

constexpr const char* kLoggerName     = "cms-admin";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

// Environment beats the config file, which beats the built-in default.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// Values that need quoting would make key=value lines ambiguous.
std::string FormatValue(const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\n\"=") == std::string::npos) {
    return value;
  }

  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') quoted.push_back('\\');
    if (c == '\n') {
      quoted += "\\n";
      continue;
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
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

void InitializeLogging(const cms::runtime::config::RuntimeConfig& config) {
  const auto level_name = Resolve("CMS_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  const auto pattern    = Resolve("CMS_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);

  // from_str maps unknown names to "off"; refuse to silence the process by typo.
  auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    level = spdlog::level::info;
    logger->warn("Unknown log level {}, using info", level_name);
  }
  logger->set_level(level);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += FormatValue(field.value);
  }
  logger->log(level, line);
}

} // namespace cms::observability
