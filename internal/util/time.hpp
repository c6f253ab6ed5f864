#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace goalgraph::util {

/*
  Time utilities. Now() is the single clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

TimePoint AddDays(TimePoint tp, std::int64_t days);

// ISO-8601 UTC, second precision.
std::string FormatUtc(TimePoint tp);

} // namespace goalgraph::util
