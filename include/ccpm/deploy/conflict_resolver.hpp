#pragma once

#include <ccpm/config/app_config.hpp>
#include <ccpm/core/log.hpp>
#include <ccpm/core/prompt.hpp>

#include <chrono>
#include <filesystem>

namespace ccpm {

// ---------------------------------------------------------------------------
// ConflictResolver: decides whether an existing target may be overwritten.
//
//   skip      -> never overwrite
//   overwrite -> always overwrite
//   prompt    -> ask IPrompt; declining, timing out, or running without a
//                terminal all mean "do not overwrite"
//
// The prompt is borrowed and must outlive the resolver.
// ---------------------------------------------------------------------------
class ConflictResolver {
public:
    static constexpr std::chrono::milliseconds kDefaultPromptTimeout{30000};

    ConflictResolver(IPrompt& prompt, Logger& logger,
                     std::chrono::milliseconds prompt_timeout = kDefaultPromptTimeout);

    /// Returns true when the copy should proceed.
    [[nodiscard]] bool ShouldOverwrite(const std::filesystem::path& target,
                                       ConflictStrategy strategy);

private:
    IPrompt& prompt_;
    Logger& logger_;
    std::chrono::milliseconds prompt_timeout_;
};

} // namespace ccpm
