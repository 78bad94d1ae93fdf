#pragma once

#include <ccpm/core/log.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

namespace ccpm {

// ---------------------------------------------------------------------------
// IPrompt: yes/no question to the user. Implementations must always return:
// on timeout, on a non-interactive terminal, or under CI they answer
// default_answer.
// ---------------------------------------------------------------------------
class IPrompt {
public:
    virtual ~IPrompt() = default;

    [[nodiscard]] virtual bool PromptYesNo(std::string_view message,
                                           bool default_answer,
                                           std::chrono::milliseconds timeout) = 0;
};

// ---------------------------------------------------------------------------
// TerminalPrompt: reads one line from stdin with poll(2) and a deadline.
// Accepts "y"/"yes" (case-insensitive) as affirmative, anything else as no,
// and an empty line as default_answer.
// ---------------------------------------------------------------------------
class TerminalPrompt : public IPrompt {
public:
    TerminalPrompt(Logger& logger, std::ostream& out = std::cerr);

    [[nodiscard]] bool PromptYesNo(std::string_view message,
                                   bool default_answer,
                                   std::chrono::milliseconds timeout) override;

private:
    Logger& logger_;
    std::ostream& out_;
};

/// Interpret a typed answer. Empty input yields default_answer.
[[nodiscard]] bool ParseYesNoAnswer(std::string_view answer, bool default_answer);

} // namespace ccpm
