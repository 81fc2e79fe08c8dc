#pragma once

#include <synthetic_mcp/core/cancellation.hpp>
#include <synthetic_mcp/core/log.hpp>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// RuntimeContext — process-wide collaborators, built once in main() and
// passed by reference to the server, the dispatcher and every capability.
// ---------------------------------------------------------------------------
struct RuntimeContext {
    Logger& logger;
    // Cancelled on SIGINT/SIGTERM.
    CancellationToken shutdown;
};

} // namespace synthetic_mcp
