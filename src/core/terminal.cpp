#include <aasx_kg/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace aasx_kg {

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool IsStdoutTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(ColorChoice choice, bool is_tty) {
    if (choice == ColorChoice::Never || NoColorEnvSet()) {
        return false;
    }
    if (choice == ColorChoice::Always) {
        return true;
    }
    return is_tty;
}

} // namespace aasx_kg
