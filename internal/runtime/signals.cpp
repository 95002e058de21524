#include "internal/runtime/signals.hpp"

#include <atomic>
#include <csignal>

namespace bridgewatch::runtime {

namespace {

std::atomic<CancellationToken*> g_token{nullptr};

void HandleStopSignal(int) {
  if (auto* token = g_token.load()) {
    token->RequestStop();
  }
}

} // namespace

void InstallStopSignalHandlers(CancellationToken& token) {
  g_token.store(&token);
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);
}

} // namespace bridgewatch::runtime
