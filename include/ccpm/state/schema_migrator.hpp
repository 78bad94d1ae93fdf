#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/state/state_types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccpm {

enum class StateFormat {
    V1,
    V2,
    Unknown,
};

[[nodiscard]] const char* StateFormatName(StateFormat format);

struct VersionInfo {
    std::string version;   // as found on disk, "2.0.0" for current files
    StateFormat format = StateFormat::Unknown;
    bool migration_required = false;
};

struct MigrationOptions {
    bool create_backup = true;
    std::optional<std::filesystem::path> backup_path;
    bool validate_after = true;
};

struct MigrationStatistics {
    int repositories_migrated = 0;
    int files_migrated = 0;
    int records_created = 0;
};

struct MigrationResult {
    bool success = false;
    std::string message;
    std::string from_version;
    std::string to_version;
    std::optional<std::string> backup_path;
    std::vector<std::string> errors;
    std::optional<MigrationStatistics> statistics;
};

nlohmann::json ToJson(const MigrationResult& result);

struct CheckAndMigrateResult {
    bool migrated = false;
    std::optional<std::string> backup_path;
};

// ---------------------------------------------------------------------------
// SchemaMigrator: upgrades legacy state documents in place.
//
// A migration first copies the file byte-for-byte to
// <stem>.backup.<timestamp>.json, then writes the converted document with
// LockedWriteFile, under the same lock the StateStore takes. On failure the
// original file and the backup are intact. A legacy field of the wrong type
// fails the migration.
// ---------------------------------------------------------------------------
class SchemaMigrator {
public:
    explicit SchemaMigrator(const Context& ctx);

    /// A missing file is reported as current.
    [[nodiscard]] Result<VersionInfo, Error> DetectVersion(
        const std::filesystem::path& state_path) const;

    [[nodiscard]] MigrationResult Migrate(const std::filesystem::path& state_path,
                                          const MigrationOptions& options = {}) const;

    [[nodiscard]] Result<std::filesystem::path, Error> BackupStateFile(
        const std::filesystem::path& state_path,
        const std::optional<std::filesystem::path>& backup_path = std::nullopt) const;

    /// Copy a backup over the state file; with `verify` the backup must
    /// parse as JSON first.
    [[nodiscard]] Result<void, Error> RestoreFromBackup(
        const std::filesystem::path& state_path,
        const std::filesystem::path& backup_path,
        bool verify = true) const;

    /// Newest <stem>.backup.*.json beside the state file, if any.
    [[nodiscard]] std::optional<std::filesystem::path> FindLatestBackup(
        const std::filesystem::path& state_path) const;

    /// Migrate when required; a no-op for current or missing files.
    [[nodiscard]] Result<CheckAndMigrateResult, Error> CheckAndMigrate(
        const std::filesystem::path& state_path) const;

    /// Convert a parsed legacy document. Exposed for tests.
    [[nodiscard]] Result<StateFile, Error> ConvertLegacy(const nlohmann::json& legacy,
                                                         MigrationStatistics& stats) const;

private:
    const Context& ctx_;
};

} // namespace ccpm
