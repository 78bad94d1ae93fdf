#pragma once

#include <ccpm/core/result.hpp>
#include <ccpm/deploy/deploy_types.hpp>

#include <string>

namespace ccpm {

// ---------------------------------------------------------------------------
// PullSummary: what a pull changed in the working copy.
// ---------------------------------------------------------------------------
struct PullSummary {
    int files_changed = 0;
    int insertions = 0;
    int deletions = 0;
    std::string current_commit;
    std::string previous_commit;
};

// ---------------------------------------------------------------------------
// ISourceControl: abstract access to a repository's working copy.
//
// The workflow depends on this interface rather than on a git client, which
// keeps network transport out of the engine and lets tests substitute
// MockSourceControl. Failures are reported with the Network, Authentication
// or Timeout categories so ErrorRecovery can pick a strategy.
// ---------------------------------------------------------------------------
class ISourceControl {
public:
    virtual ~ISourceControl() = default;

    // Non-copyable, non-movable (polymorphic base).
    ISourceControl(const ISourceControl&) = delete;
    ISourceControl& operator=(const ISourceControl&) = delete;
    ISourceControl(ISourceControl&&) = delete;
    ISourceControl& operator=(ISourceControl&&) = delete;

    /// Materialize the working copy at repository.local_path.
    [[nodiscard]] virtual Result<void, Error> Clone(const RepositoryRef& repository) = 0;

    [[nodiscard]] virtual Result<PullSummary, Error> Pull(const RepositoryRef& repository) = 0;

    [[nodiscard]] virtual Result<std::string, Error> GetLatestCommit(
        const RepositoryRef& repository) = 0;

protected:
    ISourceControl() = default;
};

} // namespace ccpm
