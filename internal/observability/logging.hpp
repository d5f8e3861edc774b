#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cms::runtime::config {
class RuntimeConfig;
}

namespace cms::observability {

/*
  Structured logging on top of spdlog.

  A record is a message followed by key=value fields, e.g.

    RPC failed service=Evaluation/0 method=new_submission error="Connection failed."

  Values containing spaces, quotes or '=' are quoted. Level and pattern
  come from the config file; CMS_LOG_LEVEL / CMS_LOG_PATTERN override it.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const cms::runtime::config::RuntimeConfig& config);

// Flushes and drops every logger.
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace cms::observability

#define CMS_LOG_DEBUG(message, ...) ::cms::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define CMS_LOG_INFO(message, ...) ::cms::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define CMS_LOG_WARN(message, ...) ::cms::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define CMS_LOG_ERROR(message, ...) ::cms::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
