#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/prompt.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/deploy/conflict_resolver.hpp>
#include <ccpm/deploy/deploy_types.hpp>
#include <ccpm/deploy/pattern_matcher.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace ccpm {

// ---------------------------------------------------------------------------
// DeploymentEngine: copies a repository's extension files into the
// extension directory.
//
// Deploy never aborts on a single file: copy or hash failures land in
// `failed` and the batch continues. It returns Err only when the repository
// itself cannot be read.
// ---------------------------------------------------------------------------
class DeploymentEngine {
public:
    DeploymentEngine(const Context& ctx, IPrompt& prompt);

    [[nodiscard]] Result<DeploymentResult, Error> Deploy(
        const RepositoryRef& repository, const DeployOptions& options);

    /// Pattern-based detection over a working copy.
    [[nodiscard]] std::vector<PatternMatch> DetectPatterns(
        const std::filesystem::path& repository_path) const;

    /// Detection honoring the repository's deployment mode.
    [[nodiscard]] std::vector<PatternMatch> DetectPatterns(
        const RepositoryRef& repository) const;

    /// Absolute destination of a match under the extension root.
    [[nodiscard]] std::filesystem::path ResolveTargetPath(const PatternMatch& match) const;

    /// Copy a file (or a directory tree) creating missing parents. Only
    /// regular files and directories are copied; other entries are ignored.
    [[nodiscard]] Result<void, Error> CopyWithStructure(
        const std::filesystem::path& source,
        const std::filesystem::path& target) const;

    /// Remove tracked targets whose source no longer exists in the working
    /// copy. Returns the number of files removed.
    [[nodiscard]] Result<int, Error> CleanOrphanedFiles(
        const RepositoryRef& repository,
        const std::vector<DeployedFile>& tracked_files) const;

    /// ".claude/commands/x.md" for <extension root>/commands/x.md.
    [[nodiscard]] std::string DisplayPath(const std::filesystem::path& target) const;

private:
    const Context& ctx_;
    PatternMatcher matcher_;
    ConflictResolver resolver_;
};

} // namespace ccpm
