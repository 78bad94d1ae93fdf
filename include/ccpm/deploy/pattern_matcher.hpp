#pragma once

#include <ccpm/core/log.hpp>
#include <ccpm/core/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ccpm {

// A repository file selected for deployment. Never persisted.
struct PatternMatch {
    std::string file;      // relative to the repository root, '/'-separated
    std::string pattern;   // glob that selected it, or "type-based"
    TargetType target_type = TargetType::Commands;

    bool operator==(const PatternMatch& other) const {
        return file == other.file && pattern == other.pattern &&
               target_type == other.target_type;
    }
};

// ---------------------------------------------------------------------------
// Glob matching over '/'-separated relative paths.
//
//   *      any run of characters inside one segment
//   ?      one character inside one segment
//   **     zero or more whole segments
//   {a,b}  alternation, expanded before matching (no nesting)
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> ExpandBraces(std::string_view pattern);
[[nodiscard]] bool GlobMatch(std::string_view pattern, std::string_view path);

/// Extensions eligible for deployment: .js .ts .mjs .md
[[nodiscard]] bool HasDeployableExtension(std::string_view file_name);

/// node_modules, .git, dist, build
[[nodiscard]] bool IsIgnoredDirectory(std::string_view name);

/// The four patterns of one category, in evaluation order.
[[nodiscard]] std::vector<std::string> PatternsFor(TargetType type);

// ---------------------------------------------------------------------------
// PatternMatcher: enumerates deployable files in a repository working copy.
// ---------------------------------------------------------------------------
class PatternMatcher {
public:
    explicit PatternMatcher(Logger& logger);

    /// Pattern-based detection over all categories. Deduplicated by file,
    /// first match wins; within one pattern the matches are sorted.
    [[nodiscard]] std::vector<PatternMatch> Detect(
        const std::filesystem::path& repository_root) const;

    /// Type-based detection: every qualifying file belongs to `type`.
    [[nodiscard]] std::vector<PatternMatch> DetectTypeBased(
        const std::filesystem::path& repository_root, TargetType type) const;

private:
    [[nodiscard]] std::vector<std::string> ListFiles(
        const std::filesystem::path& root, bool skip_hidden) const;

    Logger& logger_;
};

} // namespace ccpm
