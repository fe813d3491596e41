#pragma once

namespace toolpipe {

/// True if stderr is a terminal. Log output is the only thing that
/// ever goes to a terminal; stdin/stdout carry protocol frames.
bool IsStderrTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace toolpipe
