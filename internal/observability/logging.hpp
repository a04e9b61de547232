#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fetchledger::runtime::config {
class RuntimeConfig;
}

namespace fetchledger::observability {

/*
  Structured logging on top of spdlog.

  A record is a message followed by key=value fields:

    Repair finished session=user_alice_20240101_120000_3f9a1c0e issues=2 repairs=1

  Values with spaces, quotes, '=' or control characters are quoted and
  escaped so one record stays one line.

  Level and pattern: FETCHLEDGER_LOG_LEVEL / FETCHLEDGER_LOG_PATTERN, then
  RuntimeConfig.logging, then info / ISO-8601 timestamps. Output goes to
  stderr; stdout is reserved for command output.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const fetchledger::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Fields are only rendered when the level is enabled.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// "message k1=v1 k2=v2"
std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields);

} // namespace fetchledger::observability

#define FETCHLEDGER_LOG_DEBUG(message, ...) ::fetchledger::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define FETCHLEDGER_LOG_INFO(message, ...) ::fetchledger::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define FETCHLEDGER_LOG_WARN(message, ...) ::fetchledger::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define FETCHLEDGER_LOG_ERROR(message, ...) ::fetchledger::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
