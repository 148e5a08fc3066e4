#pragma once

namespace azlist {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether to emit ANSI colors on `fd`. NO_COLOR beats Always.
bool ShouldUseColor(ColorMode mode, int fd);

} // namespace azlist
