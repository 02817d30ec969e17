#include <catalog_graph/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace catalog_graph {

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

// explicit_choice: 1 = --color, 0 = --no-color, -1 = not given.
bool ShouldUseColor(int explicit_choice, bool is_tty) {
    if (explicit_choice == 1) return true;
    if (explicit_choice == 0) return false;
    if (NoColorEnvSet()) return false;
    return is_tty;
}

} // namespace catalog_graph
