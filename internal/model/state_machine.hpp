#pragma once

#include <cstdint>

namespace bridgewatch::model {

enum class LoopState : std::uint8_t {
  kConnected    = 0,
  kReconnecting = 1,
  kStopping     = 2,
  kStopped      = 3,
};

constexpr bool IsTerminal(LoopState state) {
  return state == LoopState::kStopped;
}

constexpr bool CanTransition(LoopState from, LoopState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == LoopState::kStopping) {
    return true;
  }

  switch (from) {
    case LoopState::kConnected:
      return to == LoopState::kReconnecting;
    case LoopState::kReconnecting:
      return to == LoopState::kConnected;
    case LoopState::kStopping:
      return to == LoopState::kStopped;
    case LoopState::kStopped:
      return false;
  }
  return false;
}

constexpr const char* ToString(LoopState state) {
  switch (state) {
    case LoopState::kConnected: return "CONNECTED";
    case LoopState::kReconnecting: return "RECONNECTING";
    case LoopState::kStopping: return "STOPPING";
    case LoopState::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

} // namespace bridgewatch::model
