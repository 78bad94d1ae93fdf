#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/core/timestamp.hpp>
#include <ccpm/recovery/error_recovery.hpp>
#include <ccpm/state/schema_migrator.hpp>
#include <ccpm/state/state_store.hpp>
#include <ccpm/state/state_types.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ccpm {

struct HistoryFilter {
    std::optional<std::string> repository_id;
    std::optional<InstallationOperation> operation;
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    std::optional<std::size_t> limit;
};

struct ClearHistoryFilter {
    std::optional<std::string> repository_id;
    std::optional<TimePoint> before;
};

// Audit extras attached to a history record.
struct TrackOptions {
    std::optional<nlohmann::json> options;
    std::optional<std::string> commit_hash;
};

enum class ValidationIssueType {
    MissingDeploymentState,
    OrphanedDeploymentState,
    InvalidFilePath,
};

[[nodiscard]] const char* ValidationIssueTypeName(ValidationIssueType type);

struct ValidationIssue {
    ValidationIssueType type;
    std::string repository_id;
    std::string details;
};

struct ValidationReport {
    bool valid = true;
    std::vector<ValidationIssue> errors;
};

struct RepairChange {
    std::string action;
    std::string repository_id;
    std::string details;
};

struct RepairReport {
    bool repaired = false;
    std::vector<RepairChange> changes;
};

struct DeploymentStatistics {
    int total_repositories = 0;
    int installed_repositories = 0;
    int partially_installed_repositories = 0;
    int uninstalled_repositories = 0;
    int error_repositories = 0;
    int total_deployed_files = 0;
    int commands = 0;
    int agents = 0;
    int hooks = 0;
};

struct StateExport {
    StateFile state;
    std::string exported_at;
    int version = kCurrentStateVersion;
};

struct ImportOptions {
    bool merge = true;
};

struct InstallationBatchEntry {
    std::string repository_id;
    std::vector<DeployedFile> files;
};

struct DeploymentStateUpdate {
    std::string repository_id;
    DeploymentState state;
};

nlohmann::json ToJson(const ValidationReport& report);
nlohmann::json ToJson(const RepairReport& report);
nlohmann::json ToJson(const DeploymentStatistics& stats);
nlohmann::json ToJson(const StateExport& exported);

// ---------------------------------------------------------------------------
// DeploymentTracker: per-repository lifecycle and audit history on top of
// the StateStore.
//
// Reads go through a short-lived cache. Every mutation runs through
// StateStore::Mutate, so the change is applied to the on-disk document under
// the lock, and then drops the cache. Loading first migrates legacy files. When the store had to reinitialize a corrupt file
// the failure is handed to ErrorRecovery, which may restore a backup.
// ---------------------------------------------------------------------------
class DeploymentTracker {
public:
    DeploymentTracker(const Context& ctx, StateStore& store,
                      const SchemaMigrator& migrator, ErrorRecovery& recovery);

    // -- Lifecycle ----------------------------------------------------------
    [[nodiscard]] Result<std::optional<DeploymentState>, Error> GetDeploymentState(
        const std::string& repository_id);
    [[nodiscard]] Result<void, Error> UpdateDeploymentState(
        const std::string& repository_id, const DeploymentState& state);
    [[nodiscard]] Result<void, Error> RemoveDeploymentState(const std::string& repository_id);

    [[nodiscard]] Result<void, Error> TrackInstallation(
        const std::string& repository_id, const std::vector<DeployedFile>& files,
        const TrackOptions& options = {});

    /// Record a deploy outcome. Status is partial when files were deployed
    /// while others failed or were skipped, error when nothing was deployed
    /// and something failed.
    [[nodiscard]] Result<InstallationStatus, Error> TrackDeployment(
        const std::string& repository_id, const DeploymentResult& result,
        const TrackOptions& options = {});

    [[nodiscard]] Result<void, Error> TrackFailedInstallation(
        const std::string& repository_id, const std::string& error,
        const TrackOptions& options = {});

    /// Paths match a tracked file's target or its display path.
    [[nodiscard]] Result<void, Error> TrackUninstallation(
        const std::string& repository_id, const std::vector<std::string>& removed_paths,
        const TrackOptions& options = {});

    /// Bookkeeping only: deployed files on disk are left alone.
    [[nodiscard]] Result<void, Error> TrackUnregistration(const std::string& repository_id);

    // -- Repository summaries -------------------------------------------------
    /// Upsert by id. Blank url, local_path or registered_at keep the stored value.
    [[nodiscard]] Result<void, Error> RegisterRepository(const RepositorySummary& repository);
    [[nodiscard]] Result<bool, Error> UnregisterRepository(const std::string& repository_id);
    [[nodiscard]] Result<std::vector<RepositorySummary>, Error> GetRepositoriesByStatus(
        InstallationStatus status);

    // -- History ------------------------------------------------------------
    /// Most recent first.
    [[nodiscard]] Result<std::vector<InstallationRecord>, Error> GetInstallationHistory(
        const HistoryFilter& filter = {});
    [[nodiscard]] Result<void, Error> ClearInstallationHistory(
        const std::optional<ClearHistoryFilter>& filter = std::nullopt);

    // -- Queries ------------------------------------------------------------
    [[nodiscard]] Result<std::vector<DeployedFile>, Error> GetDeployedFiles(
        const std::string& repository_id);
    [[nodiscard]] Result<bool, Error> IsFileDeployed(const std::string& repository_id,
                                                     const std::string& path);
    [[nodiscard]] Result<DeploymentStatistics, Error> GetDeploymentStatistics();

    // -- Bulk ---------------------------------------------------------------
    /// All-or-nothing: one malformed entry rejects the batch before writing.
    [[nodiscard]] Result<void, Error> BulkUpdateDeploymentStates(
        const std::vector<DeploymentStateUpdate>& updates);
    [[nodiscard]] Result<void, Error> BulkTrackInstallations(
        const std::vector<InstallationBatchEntry>& installations);

    // -- Integrity ----------------------------------------------------------
    [[nodiscard]] Result<ValidationReport, Error> ValidateState();
    [[nodiscard]] Result<RepairReport, Error> RepairState();

    // -- Snapshots ----------------------------------------------------------
    [[nodiscard]] Result<StateExport, Error> ExportState(
        const std::optional<std::vector<std::string>>& repository_ids = std::nullopt);
    /// Rejects any payload whose version is not current before touching state.
    [[nodiscard]] Result<void, Error> ImportState(const nlohmann::json& data,
                                                  const ImportOptions& options = {});

    /// Outcome of the last corruption recovery, if one ran.
    [[nodiscard]] const std::optional<RecoveryResult>& LastRecovery() const noexcept {
        return last_recovery_;
    }

    void InvalidateCache() noexcept;

private:
    [[nodiscard]] Result<StateFile, Error> LoadState();
    [[nodiscard]] Result<StateFile, Error> GetState();
    /// Migrate and recover as LoadState does, then apply `change` under the lock.
    [[nodiscard]] Result<void, Error> MutateState(const StateStore::Mutation& change);
    [[nodiscard]] Result<InstallationRecord, Error> MakeRecord(
        const std::string& repository_id, InstallationOperation operation,
        const std::string& timestamp, int files_affected, bool success,
        const TrackOptions& options) const;
    [[nodiscard]] std::string ExtensionDirName() const;

    const Context& ctx_;
    StateStore& store_;
    const SchemaMigrator& migrator_;
    ErrorRecovery& recovery_;

    std::optional<StateFile> cache_;
    std::chrono::steady_clock::time_point cache_time_{};
    std::optional<RecoveryResult> last_recovery_;
};

/// Structural checks applied before a deployment state is stored.
[[nodiscard]] Result<void, Error> ValidateDeploymentState(const std::string& repository_id,
                                                          const DeploymentState& state);

} // namespace ccpm
