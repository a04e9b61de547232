#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fetchledger::util {

/*
  Time utilities: the clock source and the on-disk timestamp format.

  Stored timestamps are UTC text "YYYY-MM-DD HH:MM:SS.mmm", which sorts
  lexically and is understood by sqlite's date functions.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::string FormatTimestamp(TimePoint tp);

// Accepts "YYYY-MM-DD HH:MM:SS", a 'T' separator, an optional fraction and
// an optional trailing 'Z'. Returns nullopt for anything else.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

// "YYYYmmdd_HHMMSS", used in generated session ids.
std::string FormatCompact(TimePoint tp);

} // namespace fetchledger::util
