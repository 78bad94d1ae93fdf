#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/deploy/deployment_engine.hpp>
#include <ccpm/recovery/error_recovery.hpp>
#include <ccpm/source/i_source_control.hpp>
#include <ccpm/state/deployment_tracker.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ccpm {

// ---------------------------------------------------------------------------
// StepOutcome: outcome for each phase of the workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

[[nodiscard]] const char* StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult: outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

struct InstallRequest {
    bool interactive = false;
    std::optional<ConflictStrategy> strategy;
    // Pull the working copy before deploying. Ignored without source control.
    bool sync = false;
    // Recorded on the repository summary the first time it is seen.
    std::string url;
};

// ---------------------------------------------------------------------------
// InstallResult: per-repository outcome of install, uninstall or clean.
// ---------------------------------------------------------------------------
struct InstallResult {
    std::string repository_id;
    bool success = false;
    std::string message;
    std::optional<InstallationStatus> status;
    DeploymentResult deployment;
    std::vector<std::string> removed;
    std::optional<RecoveryResult> recovery;
    std::vector<StepResult> steps;
    std::chrono::milliseconds elapsed{0};
};

nlohmann::json ToJson(const InstallResult& result);

// ---------------------------------------------------------------------------
// InstallWorkflow: sync -> deploy -> track, plus the reverse paths.
//
// Step failures are reported inside InstallResult with success=false and,
// when a recovery strategy ran, its outcome. Err is returned only when the
// state document itself cannot be read or written.
//
// Takes ownership of nothing. The source control pointer may be null.
// ---------------------------------------------------------------------------
class InstallWorkflow {
public:
    InstallWorkflow(const Context& ctx,
                    DeploymentEngine& engine,
                    DeploymentTracker& tracker,
                    ErrorRecovery& recovery,
                    ISourceControl* source_control = nullptr);

    // Non-copyable, non-movable.
    InstallWorkflow(const InstallWorkflow&) = delete;
    InstallWorkflow& operator=(const InstallWorkflow&) = delete;
    InstallWorkflow(InstallWorkflow&&) = delete;
    InstallWorkflow& operator=(InstallWorkflow&&) = delete;

    [[nodiscard]] Result<InstallResult, Error> Install(const RepositoryRef& repository,
                                                       const InstallRequest& request = {});

    /// Remove every tracked file of the repository from the extension
    /// directory and record the uninstall.
    [[nodiscard]] Result<InstallResult, Error> Uninstall(const std::string& repository_id);

    /// Drop the repository's deployment state and summary. Files stay.
    [[nodiscard]] Result<InstallResult, Error> Unregister(const std::string& repository_id);

    /// Remove deployed files whose source has disappeared from the working
    /// copy and drop them from the deployment state.
    [[nodiscard]] Result<InstallResult, Error> Clean(const RepositoryRef& repository);

    /// Options used for recovery retries. Tests shorten the delay.
    void SetRecoveryOptions(RecoveryOptions options) { recovery_options_ = std::move(options); }

private:
    StepResult RunSyncStep(const RepositoryRef& repository, std::optional<std::string>& commit,
                           InstallResult& result);
    StepResult RunDeployStep(const RepositoryRef& repository, const InstallRequest& request,
                             InstallResult& result);
    Result<StepResult, Error> RunTrackStep(const RepositoryRef& repository,
                                           const InstallRequest& request,
                                           const std::optional<std::string>& commit,
                                           InstallResult& result);

    const Context& ctx_;
    DeploymentEngine& engine_;
    DeploymentTracker& tracker_;
    ErrorRecovery& recovery_;
    ISourceControl* source_control_;
    RecoveryOptions recovery_options_;
};

} // namespace ccpm
