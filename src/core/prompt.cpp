#include <ccpm/core/prompt.hpp>
#include <ccpm/core/terminal.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>

#include <poll.h>
#include <unistd.h>

namespace ccpm {

namespace {

constexpr const char* kComponent = "prompt";

std::string Trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

} // anonymous namespace

bool ParseYesNoAnswer(std::string_view answer, bool default_answer) {
    auto normalized = Trim(answer);
    if (normalized.empty()) {
        return default_answer;
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized == "y" || normalized == "yes";
}

TerminalPrompt::TerminalPrompt(Logger& logger, std::ostream& out)
    : logger_(logger), out_(out) {}

bool TerminalPrompt::PromptYesNo(std::string_view message,
                                 bool default_answer,
                                 std::chrono::milliseconds timeout) {
    if (!IsStdinTty() || CiEnvSet()) {
        logger_.Debug(kComponent, "Non-interactive mode detected, using default answer");
        return default_answer;
    }

    out_ << message << (default_answer ? " [Y/n]: " : " [y/N]: ");
    out_.flush();

    // Read byte-wise from fd 0 so the deadline covers the whole line and
    // std::cin buffering never blocks past it.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            out_ << '\n';
            logger_.Debug(kComponent, "Prompt timed out after " +
                          std::to_string(timeout.count()) + "ms, using default answer");
            return default_answer;
        }

        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.Warn(kComponent, "poll() failed on stdin, using default answer");
            return default_answer;
        }
        if (ready == 0) {
            continue;
        }

        char c = 0;
        const auto n = ::read(STDIN_FILENO, &c, 1);
        if (n <= 0) {
            // EOF or read error: nobody is going to answer.
            return line.empty() ? default_answer : ParseYesNoAnswer(line, default_answer);
        }
        if (c == '\n') {
            return ParseYesNoAnswer(line, default_answer);
        }
        line.push_back(c);
    }
}

} // namespace ccpm
