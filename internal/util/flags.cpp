#include "internal/util/flags.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace bridgewatch::util {

std::uint64_t ParseCountFlag(const std::string& flag, const std::string& value, std::uint64_t min, std::uint64_t max) {
  const auto range = "between " + std::to_string(min) + " and " + std::to_string(max);
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw std::invalid_argument(flag + " must be a whole number " + range);
  }

  std::size_t        consumed = 0;
  unsigned long long parsed   = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument(flag + " must be " + range);
  }
  if (consumed != value.size()) {
    throw std::invalid_argument(flag + " must be a whole number " + range);
  }
  if (parsed < min || parsed > max) {
    throw std::invalid_argument(flag + " must be " + range);
  }
  return parsed;
}

double ParseSecondsFlag(const std::string& flag, const std::string& value) {
  std::size_t consumed = 0;
  double      parsed   = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(flag + " must be a number of seconds");
  }
  if (consumed != value.size() || !std::isfinite(parsed) || parsed < 0.0) {
    throw std::invalid_argument(flag + " must be a non-negative number of seconds");
  }
  return parsed;
}

} // namespace bridgewatch::util
