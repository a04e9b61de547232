#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace fetchledger::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);
  return utc;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string FormatTimestamp(TimePoint tp) {
  const auto utc    = ToUtc(tp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis < 0 ? millis + 1000 : millis));
  return buf;
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  if (text.size() < 19) {
    return std::nullopt;
  }

  const std::string value(text);

  std::tm parsed{};
  char    separator = 0;
  int     consumed  = 0;
  if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &parsed.tm_year, &parsed.tm_mon, &parsed.tm_mday, &separator,
                  &parsed.tm_hour, &parsed.tm_min, &parsed.tm_sec, &consumed) != 7) {
    return std::nullopt;
  }
  if (separator != ' ' && separator != 'T') {
    return std::nullopt;
  }

  std::chrono::microseconds fraction{0};
  std::size_t               pos = static_cast<std::size_t>(consumed);
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    long long digits = 0;
    int       count  = 0;
    while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
      if (count < 6) {
        digits = digits * 10 + (value[pos] - '0');
        ++count;
      }
      ++pos;
    }
    if (count == 0) {
      return std::nullopt;
    }
    for (; count < 6; ++count) digits *= 10;
    fraction = std::chrono::microseconds(digits);
  }
  if (pos < value.size() && value[pos] == 'Z') {
    ++pos;
  }
  if (pos != value.size()) {
    return std::nullopt;
  }

  parsed.tm_year -= 1900;
  parsed.tm_mon -= 1;
  const std::time_t seconds = timegm(&parsed);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  return std::chrono::time_point_cast<Clock::duration>(Clock::from_time_t(seconds) + fraction);
}

std::string FormatCompact(TimePoint tp) {
  const auto utc = ToUtc(tp);

  char buf[24];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec);
  return buf;
}

} // namespace fetchledger::util
