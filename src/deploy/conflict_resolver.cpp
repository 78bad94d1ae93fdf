#include <ccpm/deploy/conflict_resolver.hpp>

namespace ccpm {

namespace {
constexpr const char* kComponent = "conflict";
} // namespace

ConflictResolver::ConflictResolver(IPrompt& prompt, Logger& logger,
                                   std::chrono::milliseconds prompt_timeout)
    : prompt_(prompt), logger_(logger), prompt_timeout_(prompt_timeout) {}

bool ConflictResolver::ShouldOverwrite(const std::filesystem::path& target,
                                       ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::Skip:
            logger_.Info(kComponent, "Skipping existing file: " + target.string());
            return false;

        case ConflictStrategy::Overwrite:
            logger_.Info(kComponent, "Overwriting existing file: " + target.string());
            return true;

        case ConflictStrategy::Prompt: {
            const bool answer = prompt_.PromptYesNo(
                "File " + target.string() + " already exists. Overwrite?",
                /*default_answer=*/false, prompt_timeout_);
            logger_.Debug(kComponent, std::string(answer ? "Overwrite" : "Keep") +
                          " existing file: " + target.string());
            return answer;
        }
    }
    return false;
}

} // namespace ccpm
