#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fetchledger::observability {
namespace {

constexpr const char* kLoggerName     = "fetchledger";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// spdlog::level::from_str maps unknown names to "off"; treat those as unset.
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (const char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || static_cast<unsigned char>(c) < 0x20) {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }

  out.push_back('"');
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
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

std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out.push_back(' ');
    out += field.key;
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const fetchledger::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }

  const auto pattern = Env("FETCHLEDGER_LOG_PATTERN").value_or(config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern());
  logger->set_pattern(pattern);

  std::string level_name = Env("FETCHLEDGER_LOG_LEVEL").value_or(config.logging().level());
  const auto  level      = level_name.empty() ? std::optional(spdlog::level::info) : ParseLevel(level_name);
  logger->set_level(level.value_or(spdlog::level::info));

  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  if (!level) {
    Log(spdlog::level::warn, "Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", FormatRecord(message, fields));
}

} // namespace fetchledger::observability
