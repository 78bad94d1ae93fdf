#include <ccpm/workflow/install_workflow.hpp>

#include <chrono>
#include <filesystem>
#include <system_error>

namespace ccpm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kComponent = "workflow";

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

json StepToJson(const StepResult& step) {
    return json{{"step", step.step_name},
                {"outcome", StepOutcomeName(step.outcome)},
                {"message", step.message},
                {"durationMs", step.duration.count()}};
}

} // namespace

const char* StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "failed";
}

json ToJson(const InstallResult& result) {
    json j{{"repositoryId", result.repository_id},
           {"success", result.success},
           {"message", result.message},
           {"deployment", ToJson(result.deployment)},
           {"elapsedMs", result.elapsed.count()}};
    if (result.status.has_value()) {
        j["status"] = InstallationStatusName(*result.status);
    }
    if (!result.removed.empty()) {
        j["removed"] = result.removed;
    }
    if (result.recovery.has_value()) {
        json recovery{{"success", result.recovery->success},
                      {"strategy", RecoveryStrategyName(result.recovery->strategy)},
                      {"message", result.recovery->message},
                      {"retryCount", result.recovery->retry_count}};
        if (result.recovery->backup_used.has_value()) {
            recovery["backupUsed"] = *result.recovery->backup_used;
        }
        j["recovery"] = std::move(recovery);
    }
    json steps = json::array();
    for (const auto& step : result.steps) {
        steps.push_back(StepToJson(step));
    }
    j["steps"] = std::move(steps);
    return j;
}

InstallWorkflow::InstallWorkflow(const Context& ctx,
                                 DeploymentEngine& engine,
                                 DeploymentTracker& tracker,
                                 ErrorRecovery& recovery,
                                 ISourceControl* source_control)
    : ctx_(ctx), engine_(engine), tracker_(tracker), recovery_(recovery),
      source_control_(source_control) {}

// ---------------------------------------------------------------------------
// Install
// ---------------------------------------------------------------------------
Result<InstallResult, Error> InstallWorkflow::Install(const RepositoryRef& repository,
                                                      const InstallRequest& request) {
    auto total_start = Clock::now();
    InstallResult result;
    result.repository_id = repository.id;

    RepositorySummary summary;
    summary.id = repository.id;
    summary.name = repository.name;
    summary.url = request.url;
    summary.local_path = repository.local_path;
    summary.type = repository.type;
    summary.deployment_mode = repository.deployment_mode;
    auto registered = tracker_.RegisterRepository(summary);
    if (registered.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(registered).Error());
    }

    // Step 1: Sync.
    std::optional<std::string> commit;
    if (request.sync && source_control_ != nullptr) {
        auto sync_step = RunSyncStep(repository, commit, result);
        result.steps.push_back(sync_step);
        if (sync_step.outcome == StepOutcome::Failed) {
            auto tracked = tracker_.TrackFailedInstallation(repository.id, sync_step.message);
            if (tracked.IsErr()) {
                return Result<InstallResult, Error>::Err(std::move(tracked).Error());
            }
            result.status = InstallationStatus::Error;
            result.message = "Sync step failed: " + sync_step.message;
            result.elapsed = Elapsed(total_start);
            return Result<InstallResult, Error>::Ok(std::move(result));
        }
    } else {
        result.steps.push_back(StepResult{"sync", StepOutcome::Skipped,
                                          "working copy used as is",
                                          std::chrono::milliseconds{0}});
    }

    // Step 2: Deploy.
    auto deploy_step = RunDeployStep(repository, request, result);
    result.steps.push_back(deploy_step);
    if (deploy_step.outcome == StepOutcome::Failed) {
        auto tracked = tracker_.TrackFailedInstallation(repository.id, deploy_step.message);
        if (tracked.IsErr()) {
            return Result<InstallResult, Error>::Err(std::move(tracked).Error());
        }
        result.status = InstallationStatus::Error;
        result.message = "Deploy step failed: " + deploy_step.message;
        result.elapsed = Elapsed(total_start);
        return Result<InstallResult, Error>::Ok(std::move(result));
    }

    // Step 3: Track.
    auto track_step = RunTrackStep(repository, request, commit, result);
    if (track_step.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(track_step).Error());
    }
    result.steps.push_back(track_step.Value());

    result.success = result.deployment.failed.empty();
    result.message = std::to_string(result.deployment.deployed.size()) + " deployed, " +
                     std::to_string(result.deployment.skipped.size()) + " skipped, " +
                     std::to_string(result.deployment.failed.size()) + " failed";
    result.elapsed = Elapsed(total_start);
    ctx_.logger.Info(kComponent, "Installed " + repository.id + ": " + result.message);
    return Result<InstallResult, Error>::Ok(std::move(result));
}

StepResult InstallWorkflow::RunSyncStep(const RepositoryRef& repository,
                                        std::optional<std::string>& commit,
                                        InstallResult& result) {
    auto start = Clock::now();
    std::string changed;

    auto pull = [&]() -> Result<void, Error> {
        auto pulled = source_control_->Pull(repository);
        if (pulled.IsErr()) {
            return Result<void, Error>::Err(std::move(pulled).Error());
        }
        changed = std::to_string(pulled.Value().files_changed) + " files changed";
        if (!pulled.Value().current_commit.empty()) {
            commit = pulled.Value().current_commit;
            return Result<void, Error>::Ok();
        }
        auto latest = source_control_->GetLatestCommit(repository);
        if (latest.IsOk()) {
            commit = std::move(latest).Value();
        }
        return Result<void, Error>::Ok();
    };

    auto first = pull();
    if (first.IsOk()) {
        return StepResult{"sync", StepOutcome::Completed, changed, Elapsed(start)};
    }

    ctx_.logger.Warn(kComponent, "Sync failed for " + repository.id + ": " +
                     first.Error().ToString());
    auto options = recovery_options_;
    options.retry = pull;
    result.recovery = recovery_.Recover(ErrorRecovery::FromError(first.Error(), repository.id),
                                        options);
    if (!result.recovery->success) {
        return StepResult{"sync", StepOutcome::Failed, result.recovery->message, Elapsed(start)};
    }
    if (result.recovery->strategy == RecoveryStrategy::Skip) {
        return StepResult{"sync", StepOutcome::Skipped, result.recovery->message, Elapsed(start)};
    }
    return StepResult{"sync", StepOutcome::Completed, changed, Elapsed(start)};
}

StepResult InstallWorkflow::RunDeployStep(const RepositoryRef& repository,
                                          const InstallRequest& request,
                                          InstallResult& result) {
    auto start = Clock::now();
    DeployOptions options{request.interactive, request.strategy};

    auto deploy = [&]() -> Result<void, Error> {
        auto deployed = engine_.Deploy(repository, options);
        if (deployed.IsErr()) {
            return Result<void, Error>::Err(std::move(deployed).Error());
        }
        result.deployment = std::move(deployed).Value();
        return Result<void, Error>::Ok();
    };

    auto first = deploy();
    if (first.IsErr()) {
        auto failure = ErrorRecovery::FromError(first.Error(), repository.id);
        if (StrategyFor(failure.kind) != RecoveryStrategy::Retry) {
            return StepResult{"deploy", StepOutcome::Failed, first.Error().ToString(),
                              Elapsed(start)};
        }
        auto recovery_options = recovery_options_;
        recovery_options.retry = deploy;
        result.recovery = recovery_.Recover(failure, recovery_options);
        if (!result.recovery->success) {
            return StepResult{"deploy", StepOutcome::Failed, result.recovery->message,
                              Elapsed(start)};
        }
    }

    const auto& d = result.deployment;
    auto outcome = d.deployed.empty() && !d.failed.empty() ? StepOutcome::Failed
                                                           : StepOutcome::Completed;
    return StepResult{"deploy", outcome,
                      std::to_string(d.deployed.size()) + " of " +
                          std::to_string(d.deployed.size() + d.skipped.size() + d.failed.size()) +
                          " files deployed",
                      Elapsed(start)};
}

Result<StepResult, Error> InstallWorkflow::RunTrackStep(const RepositoryRef& repository,
                                                        const InstallRequest& request,
                                                        const std::optional<std::string>& commit,
                                                        InstallResult& result) {
    auto start = Clock::now();

    TrackOptions track_options;
    json opts{{"interactive", request.interactive}};
    if (request.strategy.has_value()) {
        opts["strategy"] = ConflictStrategyName(*request.strategy);
    }
    track_options.options = std::move(opts);
    track_options.commit_hash = commit;

    auto track = [&]() -> Result<void, Error> {
        auto tracked = tracker_.TrackDeployment(repository.id, result.deployment, track_options);
        if (tracked.IsErr()) {
            return Result<void, Error>::Err(std::move(tracked).Error());
        }
        result.status = tracked.Value();
        return Result<void, Error>::Ok();
    };

    auto first = track();
    if (first.IsOk()) {
        return Result<StepResult, Error>::Ok(StepResult{
            "track", StepOutcome::Completed, InstallationStatusName(*result.status),
            Elapsed(start)});
    }

    // Lock contention is transient; anything else means the state is unusable.
    if (!first.Error().IsRetryable()) {
        return Result<StepResult, Error>::Err(std::move(first).Error());
    }
    auto options = recovery_options_;
    options.retry = track;
    result.recovery = recovery_.Recover(ErrorRecovery::FromError(first.Error(), repository.id),
                                        options);
    if (!result.recovery->success) {
        return Result<StepResult, Error>::Err(std::move(first).Error());
    }
    return Result<StepResult, Error>::Ok(StepResult{
        "track", StepOutcome::Completed, InstallationStatusName(*result.status), Elapsed(start)});
}

// ---------------------------------------------------------------------------
// Uninstall / unregister / clean
// ---------------------------------------------------------------------------
Result<InstallResult, Error> InstallWorkflow::Uninstall(const std::string& repository_id) {
    auto start = Clock::now();
    InstallResult result;
    result.repository_id = repository_id;

    auto state = tracker_.GetDeploymentState(repository_id);
    if (state.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(state).Error());
    }
    if (!state.Value().has_value()) {
        return Result<InstallResult, Error>::Err(Error{
            "Uninstall", "", "Repository " + repository_id + " is not installed", std::nullopt,
            ErrorCategory::NotFound});
    }

    auto remove_start = Clock::now();
    const auto parent = ctx_.ExtensionRoot().lexically_normal().parent_path();
    for (const auto& file : state.Value()->deployed_files) {
        const fs::path target = file.target.empty() ? parent / file.path : fs::path(file.target);
        std::error_code ec;
        fs::remove(target, ec);
        if (ec) {
            ctx_.logger.Warn(kComponent, "Failed to remove " + target.string() + ": " +
                             ec.message());
            result.deployment.failed.push_back(target.string());
            continue;
        }
        result.removed.push_back(file.target.empty() ? file.path : file.target);
    }
    result.steps.push_back(StepResult{"remove", result.deployment.failed.empty()
                                                    ? StepOutcome::Completed
                                                    : StepOutcome::Failed,
                                      std::to_string(result.removed.size()) + " files removed",
                                      Elapsed(remove_start)});

    auto track_start = Clock::now();
    auto tracked = tracker_.TrackUninstallation(repository_id, result.removed);
    if (tracked.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(tracked).Error());
    }
    result.steps.push_back(StepResult{"track", StepOutcome::Completed, "uninstall recorded",
                                      Elapsed(track_start)});

    result.status = result.deployment.failed.empty() ? InstallationStatus::Uninstalled
                                                     : InstallationStatus::Partial;
    result.success = result.deployment.failed.empty();
    result.message = std::to_string(result.removed.size()) + " removed, " +
                     std::to_string(result.deployment.failed.size()) + " failed";
    result.elapsed = Elapsed(start);
    ctx_.logger.Info(kComponent, "Uninstalled " + repository_id + ": " + result.message);
    return Result<InstallResult, Error>::Ok(std::move(result));
}

Result<InstallResult, Error> InstallWorkflow::Unregister(const std::string& repository_id) {
    auto start = Clock::now();
    InstallResult result;
    result.repository_id = repository_id;

    auto tracked = tracker_.TrackUnregistration(repository_id);
    if (tracked.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(tracked).Error());
    }
    auto removed = tracker_.UnregisterRepository(repository_id);
    if (removed.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(removed).Error());
    }

    result.success = true;
    result.message = removed.Value() ? "repository unregistered"
                                     : "repository was not registered";
    result.steps.push_back(StepResult{"unregister", StepOutcome::Completed, result.message,
                                      Elapsed(start)});
    result.elapsed = Elapsed(start);
    return Result<InstallResult, Error>::Ok(std::move(result));
}

Result<InstallResult, Error> InstallWorkflow::Clean(const RepositoryRef& repository) {
    auto start = Clock::now();
    InstallResult result;
    result.repository_id = repository.id;

    auto state = tracker_.GetDeploymentState(repository.id);
    if (state.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(state).Error());
    }
    if (!state.Value().has_value()) {
        result.success = true;
        result.message = "nothing deployed";
        result.elapsed = Elapsed(start);
        return Result<InstallResult, Error>::Ok(std::move(result));
    }
    auto current = std::move(state).Value().value();

    auto cleaned = engine_.CleanOrphanedFiles(repository, current.deployed_files);
    if (cleaned.IsErr()) {
        return Result<InstallResult, Error>::Err(std::move(cleaned).Error());
    }

    std::vector<DeployedFile> remaining;
    for (const auto& file : current.deployed_files) {
        std::error_code ec;
        if (!file.target.empty() && !fs::exists(file.target, ec)) {
            result.removed.push_back(file.target);
            continue;
        }
        remaining.push_back(file);
    }

    if (!result.removed.empty()) {
        current.deployed_files = std::move(remaining);
        if (current.deployed_files.empty()) {
            current.installation_status = InstallationStatus::Uninstalled;
        } else if (current.installation_status == InstallationStatus::Uninstalled) {
            current.installation_status = InstallationStatus::Partial;
        }
        auto updated = tracker_.UpdateDeploymentState(repository.id, current);
        if (updated.IsErr()) {
            return Result<InstallResult, Error>::Err(std::move(updated).Error());
        }
    }

    result.status = current.installation_status;
    result.success = true;
    result.message = std::to_string(cleaned.Value()) + " orphaned files removed";
    result.steps.push_back(StepResult{"clean", StepOutcome::Completed, result.message,
                                      Elapsed(start)});
    result.elapsed = Elapsed(start);
    return Result<InstallResult, Error>::Ok(std::move(result));
}

} // namespace ccpm
