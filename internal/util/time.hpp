#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace jobstore::util {

/*
  Time utilities — single place to control clock source.

  Documents store instants as unix milliseconds (JSON numbers).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);
double    ToUnixSeconds(TimePoint tp);

// 2024-05-01T10:20:30.123Z
std::string ToIso8601(TimePoint tp);

// UTC calendar day / hour buckets used by monitoring
std::string ToDateKey(TimePoint tp);
TimePoint   StartOfUtcDay(TimePoint tp);
TimePoint   StartOfUtcHour(TimePoint tp);

} // namespace jobstore::util
