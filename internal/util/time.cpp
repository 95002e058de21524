#include "time.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace bridgewatch::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatTimestamp(std::int64_t unix_ms) {
  std::int64_t seconds = unix_ms / 1000;
  std::int64_t millis  = unix_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
  return out;
}

std::chrono::milliseconds SecondsToMillis(double seconds) {
  if (!(seconds > 0)) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

} // namespace bridgewatch::util
