#include "internal/runtime/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace bridgewatch::runtime {

namespace {
constexpr std::chrono::milliseconds kSlice{100};
}

void SleepFor(const CancellationToken& token, std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (!token.StopRequested()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
  }
}

Sleeper InterruptibleSleeper(const CancellationToken& token) {
  return [&token](std::chrono::milliseconds duration) { SleepFor(token, duration); };
}

} // namespace bridgewatch::runtime
