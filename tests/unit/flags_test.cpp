#include "internal/util/flags.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

using bridgewatch::util::ParseCountFlag;
using bridgewatch::util::ParseSecondsFlag;

constexpr std::uint64_t kMaxBatch = std::numeric_limits<std::uint32_t>::max();

bool RejectsCount(const std::string& value, std::uint64_t min, std::uint64_t max) {
  try {
    (void)ParseCountFlag("--batch-size", value, min, max);
  } catch (const std::invalid_argument& e) {
    assert(std::string(e.what()).find("--batch-size") != std::string::npos);
    return true;
  }
  return false;
}

bool RejectsSeconds(const std::string& value) {
  try {
    (void)ParseSecondsFlag("--speed", value);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestCountWithinRange() {
  assert(ParseCountFlag("--batch-size", "1", 1, kMaxBatch) == 1);
  assert(ParseCountFlag("--batch-size", "250", 1, kMaxBatch) == 250);
  assert(ParseCountFlag("--batch-size", "4294967295", 1, kMaxBatch) == kMaxBatch);
  assert(ParseCountFlag("--count", "0", 0, std::numeric_limits<std::uint64_t>::max()) == 0);
}

void TestCountBeyondTargetTypeIsRejected() {
  // one past uint32 max must not wrap to 0
  assert(RejectsCount("4294967296", 1, kMaxBatch));
  assert(RejectsCount("99999999999999999999999", 1, kMaxBatch));
}

void TestMalformedCountIsRejected() {
  assert(RejectsCount("0", 1, kMaxBatch));
  assert(RejectsCount("-5", 1, kMaxBatch));
  assert(RejectsCount("+5", 1, kMaxBatch));
  assert(RejectsCount("12abc", 1, kMaxBatch));
  assert(RejectsCount("", 1, kMaxBatch));
}

void TestSeconds() {
  assert(ParseSecondsFlag("--speed", "0") == 0.0);
  assert(ParseSecondsFlag("--speed", "0.25") == 0.25);
  assert(RejectsSeconds("-1"));
  assert(RejectsSeconds("fast"));
  assert(RejectsSeconds("1s"));
  assert(RejectsSeconds("inf"));
}

} // namespace

int main() {
  TestCountWithinRange();
  TestCountBeyondTargetTypeIsRejected();
  TestMalformedCountIsRejected();
  TestSeconds();

  std::cout << "bridgewatch_unit_flags: pass\n";
  return 0;
}
