#include <toolpipe/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace toolpipe {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace toolpipe
