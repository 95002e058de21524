#pragma once

#include <cstdint>
#include <string>

namespace bridgewatch::util {

// Whole-number flag value within [min, max]. Throws std::invalid_argument
// naming the flag for signs, trailing text and out-of-range values.
std::uint64_t ParseCountFlag(const std::string& flag, const std::string& value, std::uint64_t min, std::uint64_t max);

// Non-negative, finite number of seconds.
double ParseSecondsFlag(const std::string& flag, const std::string& value);

} // namespace bridgewatch::util
