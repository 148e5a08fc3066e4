#include <azlist/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace azlist {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ShouldUseColor(ColorMode mode, int fd) {
    if (NoColorEnvSet() || mode == ColorMode::Never) {
        return false;
    }
    if (mode == ColorMode::Always) {
        return true;
    }
    return IsTerminal(fd);
}

} // namespace azlist
