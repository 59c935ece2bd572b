#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace jobstore::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           out{};
  gmtime_r(&t, &out);
  return out;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

double ToUnixSeconds(TimePoint tp) {
  return static_cast<double>(ToUnixMillis(tp)) / 1000.0;
}

std::string ToIso8601(TimePoint tp) {
  const auto tm     = ToUtc(tp);
  const auto millis = ToUnixMillis(tp) % 1000;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<int>(millis < 0 ? millis + 1000 : millis));
  return buf;
}

std::string ToDateKey(TimePoint tp) {
  const auto tm = ToUtc(tp);
  char       buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

TimePoint StartOfUtcDay(TimePoint tp) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  return TimePoint{} + std::chrono::seconds(secs - (secs % 86400));
}

TimePoint StartOfUtcHour(TimePoint tp) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  return TimePoint{} + std::chrono::seconds(secs - (secs % 3600));
}

} // namespace jobstore::util
