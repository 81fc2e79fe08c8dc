#include <synthetic_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace synthetic_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace synthetic_mcp
