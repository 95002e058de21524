#pragma once

#include <atomic>
#include <chrono>
#include <functional>

namespace bridgewatch::runtime {

/*
  Cooperative stop flag owned by a process main and passed explicitly to
  the loops it drives. RequestStop() is async-signal-safe.
*/
class CancellationToken {
 public:
  void RequestStop() noexcept {
    stop_.store(true);
  }

  bool StopRequested() const noexcept {
    return stop_.load();
  }

 private:
  std::atomic<bool> stop_{false};
};

static_assert(std::atomic<bool>::is_always_lock_free);

// Suspension point between cycles / insertions. Tests swap in one that records
// the requested duration and returns immediately.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Sleeps for duration in short slices, returning early once stop is requested.
void SleepFor(const CancellationToken& token, std::chrono::milliseconds duration);

Sleeper InterruptibleSleeper(const CancellationToken& token);

} // namespace bridgewatch::runtime
