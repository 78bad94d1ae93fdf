#include <ccpm/state/deployment_tracker.hpp>

#include <ccpm/core/hash.hpp>

#include <algorithm>
#include <set>

namespace ccpm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kComponent = "tracker";
constexpr std::size_t kRecordIdBytes = 16;

Error MakeValidationError(const std::string& operation, const std::string& message) {
    return Error{operation, "", message, std::nullopt, ErrorCategory::Validation};
}

const std::string& FileKey(const DeployedFile& file) {
    return file.target.empty() ? file.path : file.target;
}

// Dedup by target path, last write wins, original order kept.
void MergeFiles(DeploymentState& state, const std::vector<DeployedFile>& files) {
    for (const auto& file : files) {
        auto it = std::find_if(state.deployed_files.begin(), state.deployed_files.end(),
                               [&file](const DeployedFile& existing) {
                                   return FileKey(existing) == FileKey(file);
                               });
        if (it != state.deployed_files.end()) {
            *it = file;
        } else {
            state.deployed_files.push_back(file);
        }
    }
}

DeploymentState& BeginInstall(StateFile& state, const std::string& repository_id,
                              const std::string& timestamp,
                              const std::optional<std::string>& commit_hash) {
    auto& ds = state.deployment_states[repository_id];
    ds.repository_id = repository_id;
    ds.last_installed = timestamp;
    if (!ds.metadata.has_value()) {
        ds.metadata = DeploymentMetadata{};
    }
    ds.metadata->total_installations++;
    if (!ds.metadata->first_installed.has_value()) {
        ds.metadata->first_installed = timestamp;
    }
    if (commit_hash.has_value()) {
        ds.metadata->last_commit_hash = commit_hash;
    }
    return ds;
}

TimePoint RecordTime(const InstallationRecord& record) {
    return ParseIso8601(record.timestamp).value_or(TimePoint{});
}

json IssuesToJson(const std::vector<ValidationIssue>& issues) {
    json arr = json::array();
    for (const auto& issue : issues) {
        arr.push_back({{"type", ValidationIssueTypeName(issue.type)},
                       {"repositoryId", issue.repository_id},
                       {"details", issue.details}});
    }
    return arr;
}

} // anonymous namespace

const char* ValidationIssueTypeName(ValidationIssueType type) {
    switch (type) {
        case ValidationIssueType::MissingDeploymentState:  return "missing_deployment_state";
        case ValidationIssueType::OrphanedDeploymentState: return "orphaned_deployment_state";
        case ValidationIssueType::InvalidFilePath:         return "invalid_file_path";
    }
    return "invalid_file_path";
}

json ToJson(const ValidationReport& report) {
    return json{{"valid", report.valid}, {"errors", IssuesToJson(report.errors)}};
}

json ToJson(const RepairReport& report) {
    json changes = json::array();
    for (const auto& c : report.changes) {
        changes.push_back({{"action", c.action},
                           {"repositoryId", c.repository_id},
                           {"details", c.details}});
    }
    return json{{"repaired", report.repaired}, {"changes", std::move(changes)}};
}

json ToJson(const DeploymentStatistics& stats) {
    return json{
        {"totalRepositories", stats.total_repositories},
        {"installedRepositories", stats.installed_repositories},
        {"partiallyInstalledRepositories", stats.partially_installed_repositories},
        {"uninstalledRepositories", stats.uninstalled_repositories},
        {"errorRepositories", stats.error_repositories},
        {"totalDeployedFiles", stats.total_deployed_files},
        {"deploymentsByType",
         {{"commands", stats.commands}, {"agents", stats.agents}, {"hooks", stats.hooks}}},
    };
}

json ToJson(const StateExport& exported) {
    return json{{"state", ToJson(exported.state)},
                {"exportedAt", exported.exported_at},
                {"version", exported.version}};
}

Result<void, Error> ValidateDeploymentState(const std::string& repository_id,
                                            const DeploymentState& state) {
    const char* op = "ValidateDeploymentState";
    if (state.repository_id.empty()) {
        return Result<void, Error>::Err(MakeValidationError(op, "repositoryId is required"));
    }
    if (state.repository_id != repository_id) {
        return Result<void, Error>::Err(MakeValidationError(
            op, "repositoryId '" + state.repository_id + "' does not match '" +
                    repository_id + "'"));
    }
    if (state.installation_status == InstallationStatus::Installed &&
        state.deployed_files.empty()) {
        return Result<void, Error>::Err(
            MakeValidationError(op, "installed state requires deployed files"));
    }
    if (state.installation_status == InstallationStatus::Uninstalled &&
        !state.deployed_files.empty()) {
        return Result<void, Error>::Err(
            MakeValidationError(op, "uninstalled state must not list deployed files"));
    }
    for (const auto& file : state.deployed_files) {
        if (FileKey(file).empty()) {
            return Result<void, Error>::Err(
                MakeValidationError(op, "deployed file without a target path"));
        }
    }
    return Result<void, Error>::Ok();
}

DeploymentTracker::DeploymentTracker(const Context& ctx, StateStore& store,
                                     const SchemaMigrator& migrator, ErrorRecovery& recovery)
    : ctx_(ctx), store_(store), migrator_(migrator), recovery_(recovery) {}

// ===========================================================================
// Loading and caching
// ===========================================================================
Result<StateFile, Error> DeploymentTracker::LoadState() {
    const auto state_path = store_.StatePath();

    auto migrated = migrator_.CheckAndMigrate(state_path);
    if (migrated.IsErr()) {
        return Result<StateFile, Error>::Err(std::move(migrated).Error());
    }
    if (migrated.Value().migrated) {
        ctx_.logger.Info(kComponent, "Migrated legacy state file " + state_path.string());
    }

    auto loaded = store_.Load();
    if (loaded.IsErr() || !store_.LastLoadRecoveredFromCorruption()) {
        return loaded;
    }

    RecoverableFailure failure;
    failure.kind = FailureKind::StateCorruption;
    failure.message = store_.LastCorruptionError().has_value()
                          ? store_.LastCorruptionError()->message
                          : "State file could not be parsed";
    failure.state_file = state_path;
    failure.backup = migrator_.FindLatestBackup(state_path);

    last_recovery_ = recovery_.Recover(failure);
    ctx_.logger.Warn(kComponent, last_recovery_->message);
    if (!last_recovery_->success || last_recovery_->strategy != RecoveryStrategy::RestoreBackup) {
        return loaded;
    }

    // The restored backup may predate the current schema.
    auto remigrated = migrator_.CheckAndMigrate(state_path);
    if (remigrated.IsErr()) {
        return Result<StateFile, Error>::Err(std::move(remigrated).Error());
    }
    return store_.Load();
}

Result<StateFile, Error> DeploymentTracker::GetState() {
    const auto ttl = std::chrono::milliseconds(ctx_.config.state.cache_ttl_ms);
    const auto now = std::chrono::steady_clock::now();
    if (cache_.has_value() && ttl.count() > 0 && now - cache_time_ < ttl) {
        return Result<StateFile, Error>::Ok(*cache_);
    }

    auto loaded = LoadState();
    if (loaded.IsOk()) {
        cache_ = loaded.Value();
        cache_time_ = now;
    }
    return loaded;
}

Result<void, Error> DeploymentTracker::MutateState(const StateStore::Mutation& change) {
    auto prepared = LoadState();
    if (prepared.IsErr()) {
        return Result<void, Error>::Err(std::move(prepared).Error());
    }
    auto written = store_.Mutate(change);
    InvalidateCache();
    if (written.IsErr()) {
        return Result<void, Error>::Err(std::move(written).Error());
    }
    return Result<void, Error>::Ok();
}

void DeploymentTracker::InvalidateCache() noexcept {
    cache_.reset();
    cache_time_ = {};
}

Result<InstallationRecord, Error> DeploymentTracker::MakeRecord(
    const std::string& repository_id, InstallationOperation operation,
    const std::string& timestamp, int files_affected, bool success,
    const TrackOptions& options) const {
    auto id = RandomHex(kRecordIdBytes);
    if (id.IsErr()) {
        return Result<InstallationRecord, Error>::Err(std::move(id).Error());
    }
    InstallationRecord record;
    record.id = std::move(id).Value();
    record.repository_id = repository_id;
    record.operation = operation;
    record.timestamp = timestamp;
    record.files_affected = files_affected;
    record.success = success;
    record.options = options.options;
    if (options.commit_hash.has_value()) {
        record.metadata = RecordMetadata{options.commit_hash, std::nullopt};
    }
    return Result<InstallationRecord, Error>::Ok(std::move(record));
}

std::string DeploymentTracker::ExtensionDirName() const {
    auto root = ctx_.ExtensionRoot().lexically_normal();
    auto name = root.filename();
    if (name.empty()) {
        name = root.parent_path().filename();
    }
    return name.string();
}

// ===========================================================================
// Lifecycle
// ===========================================================================
Result<std::optional<DeploymentState>, Error> DeploymentTracker::GetDeploymentState(
    const std::string& repository_id) {
    using R = Result<std::optional<DeploymentState>, Error>;
    auto state = GetState();
    if (state.IsErr()) {
        return R::Err(std::move(state).Error());
    }
    const auto& states = state.Value().deployment_states;
    auto it = states.find(repository_id);
    if (it == states.end()) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(it->second);
}

Result<void, Error> DeploymentTracker::UpdateDeploymentState(const std::string& repository_id,
                                                             const DeploymentState& update) {
    auto valid = ValidateDeploymentState(repository_id, update);
    if (valid.IsErr()) {
        return valid;
    }
    return MutateState([&](StateFile& state) {
        state.deployment_states[repository_id] = update;
        return Result<void, Error>::Ok();
    });
}

Result<void, Error> DeploymentTracker::RemoveDeploymentState(const std::string& repository_id) {
    return MutateState([&](StateFile& state) {
        state.deployment_states.erase(repository_id);
        return Result<void, Error>::Ok();
    });
}

Result<void, Error> DeploymentTracker::TrackInstallation(const std::string& repository_id,
                                                         const std::vector<DeployedFile>& files,
                                                         const TrackOptions& options) {
    auto tracked = MutateState([&](StateFile& state) {
        const auto timestamp = Iso8601Now();
        auto& ds = BeginInstall(state, repository_id, timestamp, options.commit_hash);
        MergeFiles(ds, files);
        ds.installation_status = ds.deployed_files.empty() ? InstallationStatus::Uninstalled
                                                           : InstallationStatus::Installed;
        ds.errors.clear();

        auto record = MakeRecord(repository_id, InstallationOperation::Install, timestamp,
                                 static_cast<int>(files.size()), true, options);
        if (record.IsErr()) {
            return Result<void, Error>::Err(std::move(record).Error());
        }
        state.installation_history.push_back(std::move(record).Value());
        return Result<void, Error>::Ok();
    });
    if (tracked.IsOk()) {
        ctx_.logger.Info(kComponent, "Tracked installation of " + std::to_string(files.size()) +
                         " files for " + repository_id);
    }
    return tracked;
}

Result<InstallationStatus, Error> DeploymentTracker::TrackDeployment(
    const std::string& repository_id, const DeploymentResult& result,
    const TrackOptions& options) {
    using R = Result<InstallationStatus, Error>;
    const bool any_deployed = !result.deployed.empty();
    const bool any_failed = !result.failed.empty();
    const bool any_skipped = !result.skipped.empty();

    auto status = InstallationStatus::Installed;
    auto tracked = MutateState([&](StateFile& state) {
        const auto timestamp = Iso8601Now();
        auto& ds = BeginInstall(state, repository_id, timestamp, options.commit_hash);
        MergeFiles(ds, result.deployed);

        if (any_deployed && (any_failed || any_skipped)) {
            ds.installation_status = InstallationStatus::Partial;
        } else if (any_deployed) {
            ds.installation_status = InstallationStatus::Installed;
        } else if (any_failed) {
            ds.installation_status = InstallationStatus::Error;
        } else {
            ds.installation_status = ds.deployed_files.empty() ? InstallationStatus::Uninstalled
                                                               : InstallationStatus::Installed;
        }

        ds.errors.clear();
        for (const auto& file : result.failed) {
            ds.errors.push_back("Failed to deploy: " + file);
        }
        status = ds.installation_status;

        auto record = MakeRecord(repository_id, InstallationOperation::Install, timestamp,
                                 static_cast<int>(result.deployed.size()), !any_failed, options);
        if (record.IsErr()) {
            return Result<void, Error>::Err(std::move(record).Error());
        }
        if (any_failed) {
            record.Value().error = std::to_string(result.failed.size()) + " files failed to deploy";
        }
        state.installation_history.push_back(std::move(record).Value());
        return Result<void, Error>::Ok();
    });
    if (tracked.IsErr()) {
        return R::Err(std::move(tracked).Error());
    }
    ctx_.logger.Info(kComponent, "Tracked deployment for " + repository_id + ": " +
                     InstallationStatusName(status));
    return R::Ok(status);
}

Result<void, Error> DeploymentTracker::TrackFailedInstallation(const std::string& repository_id,
                                                               const std::string& error,
                                                               const TrackOptions& options) {
    ctx_.logger.Warn(kComponent, "Tracking failed installation for " + repository_id + ": " + error);
    return MutateState([&](StateFile& state) {
        auto& ds = state.deployment_states[repository_id];
        ds.repository_id = repository_id;
        ds.installation_status = InstallationStatus::Error;
        ds.errors = {error};

        auto record = MakeRecord(repository_id, InstallationOperation::Install, Iso8601Now(), 0,
                                 false, options);
        if (record.IsErr()) {
            return Result<void, Error>::Err(std::move(record).Error());
        }
        record.Value().error = error;
        state.installation_history.push_back(std::move(record).Value());
        return Result<void, Error>::Ok();
    });
}

Result<void, Error> DeploymentTracker::TrackUninstallation(
    const std::string& repository_id, const std::vector<std::string>& removed_paths,
    const TrackOptions& options) {
    const std::set<std::string> removed(removed_paths.begin(), removed_paths.end());
    return MutateState([&](StateFile& state) {
        const auto timestamp = Iso8601Now();
        auto& states = state.deployment_states;
        if (auto it = states.find(repository_id); it != states.end()) {
            auto& ds = it->second;
            auto& files = ds.deployed_files;
            files.erase(std::remove_if(files.begin(), files.end(),
                                       [&removed](const DeployedFile& f) {
                                           return removed.count(f.target) != 0 ||
                                                  removed.count(f.path) != 0;
                                       }),
                        files.end());
            ds.last_uninstalled = timestamp;
            ds.installation_status =
                files.empty() ? InstallationStatus::Uninstalled : InstallationStatus::Partial;
            if (!ds.metadata.has_value()) {
                ds.metadata = DeploymentMetadata{};
            }
            ds.metadata->total_uninstallations++;
        }

        auto record = MakeRecord(repository_id, InstallationOperation::Uninstall, timestamp,
                                 static_cast<int>(removed_paths.size()), true, options);
        if (record.IsErr()) {
            return Result<void, Error>::Err(std::move(record).Error());
        }
        state.installation_history.push_back(std::move(record).Value());
        return Result<void, Error>::Ok();
    });
}

Result<void, Error> DeploymentTracker::TrackUnregistration(const std::string& repository_id) {
    return MutateState([&](StateFile& state) {
        state.deployment_states.erase(repository_id);

        auto record = MakeRecord(repository_id, InstallationOperation::Unregister, Iso8601Now(),
                                 0, true, TrackOptions{});
        if (record.IsErr()) {
            return Result<void, Error>::Err(std::move(record).Error());
        }
        state.installation_history.push_back(std::move(record).Value());
        return Result<void, Error>::Ok();
    });
}

// ===========================================================================
// Repository summaries
// ===========================================================================
Result<void, Error> DeploymentTracker::RegisterRepository(const RepositorySummary& repository) {
    if (repository.id.empty()) {
        return Result<void, Error>::Err(
            MakeValidationError("RegisterRepository", "repository id is required"));
    }
    return MutateState([&repository](StateFile& state) {
        auto& repos = state.repositories;
        auto it = std::find_if(repos.begin(), repos.end(),
                               [&repository](const RepositorySummary& r) {
                                   return r.id == repository.id;
                               });
        if (it != repos.end()) {
            // Fields the caller left blank keep their registered values.
            auto previous = *it;
            *it = repository;
            if (it->registered_at.empty()) {
                it->registered_at = previous.registered_at;
            }
            if (it->url.empty()) {
                it->url = previous.url;
            }
            if (!it->local_path.has_value()) {
                it->local_path = previous.local_path;
            }
        } else {
            repos.push_back(repository);
            if (repos.back().registered_at.empty()) {
                repos.back().registered_at = Iso8601Now();
            }
        }
        return Result<void, Error>::Ok();
    });
}

Result<bool, Error> DeploymentTracker::UnregisterRepository(const std::string& repository_id) {
    bool removed = false;
    auto written = MutateState([&](StateFile& state) {
        auto& repos = state.repositories;
        const auto before = repos.size();
        repos.erase(std::remove_if(repos.begin(), repos.end(),
                                   [&repository_id](const RepositorySummary& r) {
                                       return r.id == repository_id;
                                   }),
                    repos.end());
        removed = repos.size() != before;
        return Result<void, Error>::Ok();
    });
    if (written.IsErr()) {
        return Result<bool, Error>::Err(std::move(written).Error());
    }
    return Result<bool, Error>::Ok(removed);
}

Result<std::vector<RepositorySummary>, Error> DeploymentTracker::GetRepositoriesByStatus(
    InstallationStatus status) {
    return GetState().Map([status](const StateFile& state) {
        std::vector<RepositorySummary> out;
        for (const auto& repo : state.repositories) {
            auto it = state.deployment_states.find(repo.id);
            if (it != state.deployment_states.end() &&
                it->second.installation_status == status) {
                out.push_back(repo);
            }
        }
        return out;
    });
}

// ===========================================================================
// History
// ===========================================================================
Result<std::vector<InstallationRecord>, Error> DeploymentTracker::GetInstallationHistory(
    const HistoryFilter& filter) {
    return GetState().Map([&filter](const StateFile& state) {
        std::vector<InstallationRecord> history;
        for (const auto& record : state.installation_history) {
            if (filter.repository_id.has_value() && record.repository_id != *filter.repository_id) {
                continue;
            }
            if (filter.operation.has_value() && record.operation != *filter.operation) {
                continue;
            }
            if (filter.start.has_value() || filter.end.has_value()) {
                auto when = ParseIso8601(record.timestamp);
                if (!when.has_value()) {
                    continue;
                }
                if (filter.start.has_value() && *when < *filter.start) {
                    continue;
                }
                if (filter.end.has_value() && *when > *filter.end) {
                    continue;
                }
            }
            history.push_back(record);
        }

        // Later appends win ties.
        std::reverse(history.begin(), history.end());
        std::stable_sort(history.begin(), history.end(),
                         [](const InstallationRecord& a, const InstallationRecord& b) {
                             return RecordTime(a) > RecordTime(b);
                         });
        if (filter.limit.has_value() && history.size() > *filter.limit) {
            history.resize(*filter.limit);
        }
        return history;
    });
}

Result<void, Error> DeploymentTracker::ClearInstallationHistory(
    const std::optional<ClearHistoryFilter>& filter) {
    return MutateState([&filter](StateFile& state) {
        auto& history = state.installation_history;
        if (!filter.has_value()) {
            history.clear();
            return Result<void, Error>::Ok();
        }
        history.erase(
            std::remove_if(history.begin(), history.end(),
                           [&filter](const InstallationRecord& r) {
                               if (filter->repository_id.has_value() &&
                                   r.repository_id == *filter->repository_id) {
                                   return true;
                               }
                               if (filter->before.has_value()) {
                                   auto when = ParseIso8601(r.timestamp);
                                   return when.has_value() && *when < *filter->before;
                               }
                               return false;
                           }),
            history.end());
        return Result<void, Error>::Ok();
    });
}

// ===========================================================================
// Queries
// ===========================================================================
Result<std::vector<DeployedFile>, Error> DeploymentTracker::GetDeployedFiles(
    const std::string& repository_id) {
    return GetState().Map([&repository_id](const StateFile& state) {
        auto it = state.deployment_states.find(repository_id);
        if (it == state.deployment_states.end()) {
            return std::vector<DeployedFile>{};
        }
        return it->second.deployed_files;
    });
}

Result<bool, Error> DeploymentTracker::IsFileDeployed(const std::string& repository_id,
                                                      const std::string& path) {
    return GetDeployedFiles(repository_id).Map([&path](const std::vector<DeployedFile>& files) {
        return std::any_of(files.begin(), files.end(), [&path](const DeployedFile& f) {
            return f.path == path || f.target == path;
        });
    });
}

Result<DeploymentStatistics, Error> DeploymentTracker::GetDeploymentStatistics() {
    return GetState().Map([](const StateFile& state) {
        DeploymentStatistics stats;
        stats.total_repositories = static_cast<int>(state.repositories.size());
        for (const auto& repo : state.repositories) {
            auto it = state.deployment_states.find(repo.id);
            if (it == state.deployment_states.end()) {
                stats.uninstalled_repositories++;
                continue;
            }
            const auto& ds = it->second;
            switch (ds.installation_status) {
                case InstallationStatus::Installed:   stats.installed_repositories++; break;
                case InstallationStatus::Partial:     stats.partially_installed_repositories++; break;
                case InstallationStatus::Uninstalled: stats.uninstalled_repositories++; break;
                case InstallationStatus::Error:       stats.error_repositories++; break;
            }
            stats.total_deployed_files += static_cast<int>(ds.deployed_files.size());

            for (const auto& file : ds.deployed_files) {
                auto type = file.type;
                if (!type.has_value()) {
                    const auto& p = file.path.empty() ? file.target : file.path;
                    if (p.find("agents/") != std::string::npos) {
                        type = TargetType::Agents;
                    } else if (p.find("hooks/") != std::string::npos) {
                        type = TargetType::Hooks;
                    } else {
                        type = TargetType::Commands;
                    }
                }
                switch (*type) {
                    case TargetType::Commands: stats.commands++; break;
                    case TargetType::Agents:   stats.agents++; break;
                    case TargetType::Hooks:    stats.hooks++; break;
                }
            }
        }
        return stats;
    });
}

// ===========================================================================
// Bulk
// ===========================================================================
Result<void, Error> DeploymentTracker::BulkUpdateDeploymentStates(
    const std::vector<DeploymentStateUpdate>& updates) {
    for (const auto& update : updates) {
        auto valid = ValidateDeploymentState(update.repository_id, update.state);
        if (valid.IsErr()) {
            return valid;
        }
    }
    return MutateState([&updates](StateFile& state) {
        for (const auto& update : updates) {
            state.deployment_states[update.repository_id] = update.state;
        }
        return Result<void, Error>::Ok();
    });
}

Result<void, Error> DeploymentTracker::BulkTrackInstallations(
    const std::vector<InstallationBatchEntry>& installations) {
    return MutateState([&](StateFile& state) {
        const auto timestamp = Iso8601Now();
        for (const auto& entry : installations) {
            auto& ds = BeginInstall(state, entry.repository_id, timestamp, std::nullopt);
            MergeFiles(ds, entry.files);
            ds.installation_status = ds.deployed_files.empty() ? InstallationStatus::Uninstalled
                                                               : InstallationStatus::Installed;
            ds.errors.clear();

            auto record = MakeRecord(entry.repository_id, InstallationOperation::Install,
                                     timestamp, static_cast<int>(entry.files.size()), true,
                                     TrackOptions{});
            if (record.IsErr()) {
                return Result<void, Error>::Err(std::move(record).Error());
            }
            state.installation_history.push_back(std::move(record).Value());
        }
        return Result<void, Error>::Ok();
    });
}

// ===========================================================================
// Integrity
// ===========================================================================
Result<ValidationReport, Error> DeploymentTracker::ValidateState() {
    auto loaded = GetState();
    if (loaded.IsErr()) {
        return Result<ValidationReport, Error>::Err(std::move(loaded).Error());
    }
    const auto& state = loaded.Value();
    const auto marker = ExtensionDirName() + "/";

    ValidationReport report;
    for (const auto& repo : state.repositories) {
        if (state.deployment_states.count(repo.id) == 0) {
            report.errors.push_back({ValidationIssueType::MissingDeploymentState, repo.id,
                                     "Repository " + repo.id + " has no deployment state"});
        }
    }
    for (const auto& [id, ds] : state.deployment_states) {
        if (!state.HasRepository(id)) {
            report.errors.push_back({ValidationIssueType::OrphanedDeploymentState, id,
                                     "Deployment state for " + id +
                                         " has no corresponding repository"});
        }
    }
    for (const auto& [id, ds] : state.deployment_states) {
        for (const auto& file : ds.deployed_files) {
            if (file.path.find(marker) == std::string::npos) {
                report.errors.push_back({ValidationIssueType::InvalidFilePath, id,
                                         "Invalid file path: " + file.path});
            }
        }
    }
    report.valid = report.errors.empty();
    return Result<ValidationReport, Error>::Ok(std::move(report));
}

Result<RepairReport, Error> DeploymentTracker::RepairState() {
    auto validation = ValidateState();
    if (validation.IsErr()) {
        return Result<RepairReport, Error>::Err(std::move(validation).Error());
    }
    if (validation.Value().valid) {
        return Result<RepairReport, Error>::Ok(RepairReport{});
    }

    const auto dir_name = ExtensionDirName();
    const auto marker = dir_name + "/";
    const auto root = ctx_.ExtensionRoot().lexically_normal();
    const auto& issues = validation.Value().errors;

    RepairReport report;
    auto written = MutateState([&](StateFile& state) {
        report.changes.clear();
        std::set<std::string> paths_fixed;
        for (const auto& issue : issues) {
            switch (issue.type) {
                case ValidationIssueType::MissingDeploymentState: {
                    if (state.deployment_states.count(issue.repository_id) != 0) {
                        break;
                    }
                    DeploymentState placeholder;
                    placeholder.repository_id = issue.repository_id;
                    placeholder.installation_status = InstallationStatus::Uninstalled;
                    state.deployment_states.emplace(issue.repository_id, std::move(placeholder));
                    report.changes.push_back({"add_missing_deployment_state", issue.repository_id,
                                              "Added missing deployment state for " +
                                                  issue.repository_id});
                    break;
                }
                case ValidationIssueType::OrphanedDeploymentState:
                    if (state.deployment_states.erase(issue.repository_id) != 0) {
                        report.changes.push_back({"remove_orphaned_deployment_state",
                                                  issue.repository_id,
                                                  "Removed orphaned deployment state for " +
                                                      issue.repository_id});
                    }
                    break;

                case ValidationIssueType::InvalidFilePath: {
                    if (paths_fixed.count(issue.repository_id) != 0) {
                        break;
                    }
                    auto it = state.deployment_states.find(issue.repository_id);
                    if (it == state.deployment_states.end()) {
                        break;
                    }
                    for (auto& file : it->second.deployed_files) {
                        if (file.path.find(marker) != std::string::npos) {
                            continue;
                        }
                        const fs::path p(file.path);
                        const auto rel = p.lexically_normal().lexically_relative(root);
                        if (p.is_absolute() && !rel.empty() && *rel.begin() != "..") {
                            file.path = (fs::path(dir_name) / rel).generic_string();
                        } else {
                            auto trimmed = file.path;
                            trimmed.erase(0, trimmed.find_first_not_of('/'));
                            file.path = marker + trimmed;
                        }
                    }
                    paths_fixed.insert(issue.repository_id);
                    report.changes.push_back({"fix_invalid_file_paths", issue.repository_id,
                                              "Fixed invalid file paths for " + issue.repository_id});
                    break;
                }
            }
        }
        return Result<void, Error>::Ok();
    });
    if (written.IsErr()) {
        return Result<RepairReport, Error>::Err(std::move(written).Error());
    }

    report.repaired = !report.changes.empty();
    if (report.repaired) {
        ctx_.logger.Info(kComponent, "Repaired state with " +
                         std::to_string(report.changes.size()) + " changes");
    }
    return Result<RepairReport, Error>::Ok(std::move(report));
}

// ===========================================================================
// Snapshots
// ===========================================================================
Result<StateExport, Error> DeploymentTracker::ExportState(
    const std::optional<std::vector<std::string>>& repository_ids) {
    auto loaded = GetState();
    if (loaded.IsErr()) {
        return Result<StateExport, Error>::Err(std::move(loaded).Error());
    }

    StateExport exported;
    exported.state = std::move(loaded).Value();
    exported.exported_at = Iso8601Now();

    if (repository_ids.has_value()) {
        const std::set<std::string> wanted(repository_ids->begin(), repository_ids->end());
        auto& s = exported.state;
        s.repositories.erase(std::remove_if(s.repositories.begin(), s.repositories.end(),
                                            [&wanted](const RepositorySummary& r) {
                                                return wanted.count(r.id) == 0;
                                            }),
                             s.repositories.end());
        for (auto it = s.deployment_states.begin(); it != s.deployment_states.end();) {
            it = wanted.count(it->first) == 0 ? s.deployment_states.erase(it) : std::next(it);
        }
        s.installation_history.erase(
            std::remove_if(s.installation_history.begin(), s.installation_history.end(),
                           [&wanted](const InstallationRecord& r) {
                               return wanted.count(r.repository_id) == 0;
                           }),
            s.installation_history.end());
    }
    return Result<StateExport, Error>::Ok(std::move(exported));
}

Result<void, Error> DeploymentTracker::ImportState(const json& data,
                                                   const ImportOptions& options) {
    auto version = data.is_object() ? data.find("version") : data.end();
    if (!data.is_object() || version == data.end() || !version->is_number_integer() ||
        version->get<int>() != kCurrentStateVersion) {
        return Result<void, Error>::Err(Error{
            "ImportState", "", "Unsupported state version for import", std::nullopt,
            ErrorCategory::VersionMismatch});
    }

    auto payload = data.find("state");
    if (payload == data.end()) {
        return Result<void, Error>::Err(
            MakeValidationError("ImportState", "Export payload has no state"));
    }
    auto decoded = StateFileFromJson(*payload);
    if (decoded.IsErr()) {
        auto err = std::move(decoded).Error();
        err.operation = "ImportState";
        err.category = ErrorCategory::Validation;
        return Result<void, Error>::Err(std::move(err));
    }
    auto imported = std::move(decoded).Value();

    if (!options.merge) {
        ctx_.logger.Warn(kComponent, "Replacing state with imported snapshot");
        return MutateState([&imported](StateFile& state) {
            state = std::move(imported);
            return Result<void, Error>::Ok();
        });
    }

    auto merged = MutateState([&imported](StateFile& state) {
        for (auto& repo : imported.repositories) {
            if (!state.HasRepository(repo.id)) {
                state.repositories.push_back(std::move(repo));
            }
        }
        for (auto& [id, ds] : imported.deployment_states) {
            state.deployment_states[id] = std::move(ds);
        }
        for (auto& record : imported.installation_history) {
            state.installation_history.push_back(std::move(record));
        }
        return Result<void, Error>::Ok();
    });
    if (merged.IsOk()) {
        ctx_.logger.Info(kComponent, "Merged imported state");
    }
    return merged;
}

} // namespace ccpm
