#pragma once

#include "internal/runtime/cancellation.hpp"

namespace bridgewatch::runtime {

// Routes SIGINT and SIGTERM to token.RequestStop(). The token must outlive
// the process's use of the handlers.
void InstallStopSignalHandlers(CancellationToken& token);

} // namespace bridgewatch::runtime
