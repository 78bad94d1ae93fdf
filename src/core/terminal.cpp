#include <ccpm/core/terminal.hpp>

#include <cstdlib>
#include <string_view>

#include <unistd.h>

namespace ccpm {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool IsStdinTty() {
    return IsTerminal(STDIN_FILENO);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool CiEnvSet() {
    const char* val = std::getenv("CI");
    if (val == nullptr) {
        return false;
    }
    std::string_view v{val};
    return !v.empty() && v != "0" && v != "false";
}

} // namespace ccpm
