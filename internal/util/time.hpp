#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace bridgewatch::util {

/*
  Time utilities. Records carry observed_at as unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// 2024-05-01T12:30:00.250Z
std::string FormatTimestamp(std::int64_t unix_ms);

std::chrono::milliseconds SecondsToMillis(double seconds);

} // namespace bridgewatch::util
