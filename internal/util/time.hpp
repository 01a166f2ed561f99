#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace practicedb::util {

/*
  Time utilities; the single place that reads the clock.

  Document timestamps are ISO-8601 UTC with millisecond precision,
  e.g. 2024-11-20T09:30:00.000Z, so string order matches time order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

std::string ToIso8601(TimePoint tp);
std::string NowIso8601();

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM].
std::optional<TimePoint> ParseIso8601(const std::string& text);

// YYYY-MM-DD of tp shifted by offset_days (UTC).
std::string FormatDate(TimePoint tp, int offset_days = 0);

} // namespace practicedb::util
