#include <ccpm/state/schema_migrator.hpp>

#include <ccpm/core/timestamp.hpp>
#include <ccpm/state/state_store.hpp>

#include <chrono>
#include <cstdio>

namespace ccpm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kComponent = "migrate";
constexpr const char* kCurrentVersionLabel = "2.0.0";
constexpr const char* kMigrationUserAgent = "migration-v1-to-v2";

Error MakeMigrationError(const std::string& operation, const std::string& path,
                         const std::string& message) {
    return Error{operation, path, message, std::nullopt, ErrorCategory::Migration};
}

Result<json, Error> ReadJson(const fs::path& path) {
    auto contents = ReadFileContents(path);
    if (contents.IsErr()) {
        return Result<json, Error>::Err(std::move(contents).Error());
    }
    json doc = json::parse(contents.Value(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Result<json, Error>::Err(Error{
            "ReadJson", path.string(), "File is not valid JSON", std::nullopt,
            ErrorCategory::StateCorruption});
    }
    return Result<json, Error>::Ok(std::move(doc));
}

// ".claude/commands/x.md" out of "/home/u/.claude/commands/x.md".
std::string DisplayPathFromTarget(const std::string& target) {
    auto pos = target.rfind("/.claude/");
    if (pos != std::string::npos) {
        return target.substr(pos + 1);
    }
    return target;
}

long long EpochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // anonymous namespace

const char* StateFormatName(StateFormat format) {
    switch (format) {
        case StateFormat::V1:      return "v1";
        case StateFormat::V2:      return "v2";
        case StateFormat::Unknown: return "unknown";
    }
    return "unknown";
}

json ToJson(const MigrationResult& result) {
    json j;
    j["success"] = result.success;
    j["message"] = result.message;
    j["fromVersion"] = result.from_version;
    j["toVersion"] = result.to_version;
    if (result.backup_path.has_value()) {
        j["backupPath"] = *result.backup_path;
    }
    if (!result.errors.empty()) {
        j["errors"] = result.errors;
    }
    if (result.statistics.has_value()) {
        j["statistics"] = {
            {"repositoriesMigrated", result.statistics->repositories_migrated},
            {"filesMigrated", result.statistics->files_migrated},
            {"recordsCreated", result.statistics->records_created},
        };
    }
    return j;
}

SchemaMigrator::SchemaMigrator(const Context& ctx) : ctx_(ctx) {}

// ---------------------------------------------------------------------------
// DetectVersion
// ---------------------------------------------------------------------------
Result<VersionInfo, Error> SchemaMigrator::DetectVersion(const fs::path& state_path) const {
    std::error_code ec;
    if (!fs::exists(state_path, ec)) {
        return Result<VersionInfo, Error>::Ok(
            VersionInfo{kCurrentVersionLabel, StateFormat::V2, false});
    }

    auto doc = ReadJson(state_path);
    if (doc.IsErr()) {
        return Result<VersionInfo, Error>::Err(std::move(doc).Error());
    }
    const auto& j = doc.Value();

    VersionInfo info{"unknown", StateFormat::Unknown, false};
    auto version = j.is_object() ? j.find("version") : j.end();
    if (!j.is_object() || version == j.end()) {
        return Result<VersionInfo, Error>::Ok(info);
    }

    if (version->is_number_integer() && version->get<int>() == kCurrentStateVersion) {
        info = VersionInfo{kCurrentVersionLabel, StateFormat::V2, false};
    } else if (version->is_object()) {
        // A malformed version object stays Unknown; the store treats it as corruption.
        JsonFieldReader fields(*version, "version");
        const auto format = fields.String("format");
        info.version = fields.String("version", "unknown");
        if (fields.Mismatch().has_value()) {
            ctx_.logger.Warn(kComponent, *fields.Mismatch());
        } else if (format == "v2") {
            info.format = StateFormat::V2;
        } else if (format == "v1") {
            info.format = StateFormat::V1;
            info.migration_required = true;
        }
    } else if (version->is_string()) {
        info = VersionInfo{version->get<std::string>(), StateFormat::V1, true};
    } else if (version->is_number()) {
        info.version = version->dump();
    }
    return Result<VersionInfo, Error>::Ok(info);
}

// ---------------------------------------------------------------------------
// BackupStateFile
// ---------------------------------------------------------------------------
Result<fs::path, Error> SchemaMigrator::BackupStateFile(
    const fs::path& state_path, const std::optional<fs::path>& backup_path) const {
    fs::path target;
    if (backup_path.has_value()) {
        target = *backup_path;
    } else {
        const auto stem = state_path.stem().string();
        const auto dir = state_path.parent_path();
        const auto stamp = FileSafeTimestamp(std::chrono::system_clock::now());
        target = dir / (stem + ".backup." + stamp + ".json");
        // "_001" sorts after ".json", so FindLatestBackup still picks the newest.
        std::error_code ec;
        for (int n = 1; fs::exists(target, ec); ++n) {
            char suffix[16];
            std::snprintf(suffix, sizeof(suffix), "_%03d", n);
            target = dir / (stem + ".backup." + stamp + suffix + ".json");
        }
    }

    std::error_code ec;
    fs::copy_file(state_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<fs::path, Error>::Err(
            Error::FromErrorCode("BackupStateFile", target.string(), ec));
    }
    ctx_.logger.Info(kComponent, "State backed up to: " + target.string());
    return Result<fs::path, Error>::Ok(target);
}

// ---------------------------------------------------------------------------
// ConvertLegacy
// ---------------------------------------------------------------------------
Result<StateFile, Error> SchemaMigrator::ConvertLegacy(const json& legacy,
                                                       MigrationStatistics& stats) const {
    auto repos = legacy.is_object() ? legacy.find("repositories") : legacy.end();
    if (!legacy.is_object() || repos == legacy.end() || !repos->is_object()) {
        return Result<StateFile, Error>::Err(MakeMigrationError(
            "ConvertLegacy", "", "Legacy document has no repositories object"));
    }

    const auto now = Iso8601Now();
    StateFile state;
    state.metadata.last_updated = now;
    state.metadata.last_migration = now;

    for (auto entry = repos->begin(); entry != repos->end(); ++entry) {
        const auto& id = entry.key();
        const auto& v1 = entry.value();
        if (!v1.is_object()) {
            return Result<StateFile, Error>::Err(MakeMigrationError(
                "ConvertLegacy", "", "Legacy repository " + id + " is not an object"));
        }

        JsonFieldReader fields(v1, "legacy repository " + id);
        const auto last_sync = fields.String("lastSync", now);
        const auto last_commit = fields.String("lastCommit");
        const auto errors = fields.StringArray("errors");
        if (fields.Mismatch().has_value()) {
            return Result<StateFile, Error>::Err(
                MakeMigrationError("ConvertLegacy", "", *fields.Mismatch()));
        }

        DeploymentState ds;
        ds.repository_id = id;
        ds.last_installed = last_sync;
        if (auto it = v1.find("deployedFiles"); it != v1.end() && it->is_array()) {
            for (const auto& f : *it) {
                auto file = DeployedFileFromJson(f);
                if (file.IsErr()) {
                    return Result<StateFile, Error>::Err(MakeMigrationError(
                        "ConvertLegacy", "", "Legacy file entry of " + id + ": " +
                                                 file.Error().message));
                }
                auto value = std::move(file).Value();
                value.path = DisplayPathFromTarget(value.target);
                ds.deployed_files.push_back(std::move(value));
            }
        }
        ds.installation_status =
            errors.empty() ? InstallationStatus::Installed : InstallationStatus::Error;
        ds.errors = errors;

        DeploymentMetadata meta;
        meta.total_installations = 1;
        meta.first_installed = last_sync;
        if (!last_commit.empty()) {
            meta.last_commit_hash = last_commit;
        }
        ds.metadata = meta;

        InstallationRecord record;
        record.id = "migration-" + id + "-" + std::to_string(EpochMillis());
        record.repository_id = id;
        record.operation = InstallationOperation::Install;
        record.timestamp = last_sync;
        record.files_affected = static_cast<int>(ds.deployed_files.size());
        record.success = errors.empty();
        if (!errors.empty()) {
            std::string joined;
            for (const auto& e : errors) {
                joined += (joined.empty() ? "" : "; ") + e;
            }
            record.error = joined;
        }
        RecordMetadata rm;
        if (!last_commit.empty()) {
            rm.commit_hash = last_commit;
        }
        rm.user_agent = kMigrationUserAgent;
        record.metadata = rm;

        RepositorySummary summary;
        summary.id = id;
        summary.name = id;
        summary.registered_at = last_sync;
        summary.status = errors.empty() ? "active" : "error";

        stats.repositories_migrated++;
        stats.files_migrated += static_cast<int>(ds.deployed_files.size());
        stats.records_created++;

        state.repositories.push_back(std::move(summary));
        state.installation_history.push_back(std::move(record));
        state.deployment_states.emplace(id, std::move(ds));
    }
    return Result<StateFile, Error>::Ok(std::move(state));
}

// ---------------------------------------------------------------------------
// Migrate
// ---------------------------------------------------------------------------
MigrationResult SchemaMigrator::Migrate(const fs::path& state_path,
                                        const MigrationOptions& options) const {
    MigrationResult result;
    result.to_version = kCurrentVersionLabel;
    const auto started = std::chrono::steady_clock::now();

    auto fail = [&](const Error& error) {
        ctx_.logger.Error(kComponent, "Migration failed: " + error.ToString());
        result.success = false;
        result.message = "Migration failed: " + error.message;
        result.errors.push_back(error.ToString());
        return result;
    };

    auto detected = DetectVersion(state_path);
    if (detected.IsErr()) {
        result.from_version = "unknown";
        return fail(detected.Error());
    }
    const auto& info = detected.Value();
    result.from_version = info.version;

    if (info.format == StateFormat::V2) {
        result.success = true;
        result.message = "State is already in V2 format";
        return result;
    }
    if (info.format != StateFormat::V1) {
        result.message = std::string("Unsupported state format: ") + StateFormatName(info.format);
        result.errors.push_back("Cannot migrate from " + std::string(StateFormatName(info.format)) +
                                " format");
        return result;
    }

    ctx_.logger.Info(kComponent, "Starting V1 to V2 state migration");

    if (options.create_backup) {
        auto backup = BackupStateFile(state_path, options.backup_path);
        if (backup.IsErr()) {
            return fail(backup.Error());
        }
        result.backup_path = backup.Value().string();
    }

    auto legacy = ReadJson(state_path);
    if (legacy.IsErr()) {
        return fail(legacy.Error());
    }

    MigrationStatistics stats;
    auto converted = ConvertLegacy(legacy.Value(), stats);
    if (converted.IsErr()) {
        return fail(converted.Error());
    }

    auto written = LockedWriteFile(ctx_, state_path, SerializeJson(ToJson(converted.Value())));
    if (written.IsErr()) {
        return fail(written.Error());
    }

    if (options.validate_after) {
        auto reread = ReadJson(state_path);
        if (reread.IsErr()) {
            return fail(reread.Error());
        }
        auto decoded = StateFileFromJson(reread.Value());
        if (decoded.IsErr()) {
            return fail(MakeMigrationError("ValidateMigratedState", state_path.string(),
                                           decoded.Error().message));
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.success = true;
    result.message = "Migration completed successfully in " +
                     std::to_string(elapsed.count()) + "ms";
    result.statistics = stats;
    ctx_.logger.Info(kComponent, result.message + " (" +
                     std::to_string(stats.repositories_migrated) + " repositories, " +
                     std::to_string(stats.files_migrated) + " files)");
    return result;
}

// ---------------------------------------------------------------------------
// RestoreFromBackup
// ---------------------------------------------------------------------------
Result<void, Error> SchemaMigrator::RestoreFromBackup(const fs::path& state_path,
                                                      const fs::path& backup_path,
                                                      bool verify) const {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        return Result<void, Error>::Err(Error{
            "RestoreFromBackup", backup_path.string(), "Backup file does not exist",
            std::nullopt, ErrorCategory::NotFound});
    }

    auto contents = ReadFileContents(backup_path);
    if (contents.IsErr()) {
        return Result<void, Error>::Err(std::move(contents).Error());
    }
    if (verify && json::parse(contents.Value(), nullptr, false).is_discarded()) {
        return Result<void, Error>::Err(Error{
            "RestoreFromBackup", backup_path.string(), "Invalid backup file",
            "backup is not valid JSON", ErrorCategory::StateCorruption});
    }

    auto written = LockedWriteFile(ctx_, state_path, contents.Value());
    if (written.IsErr()) {
        ctx_.logger.Error(kComponent, "Failed to restore from backup: " +
                          written.Error().ToString());
        return written;
    }
    ctx_.logger.Info(kComponent, "State restored from backup: " + backup_path.string());
    return Result<void, Error>::Ok();
}

std::optional<fs::path> SchemaMigrator::FindLatestBackup(const fs::path& state_path) const {
    const auto prefix = state_path.stem().string() + ".backup.";
    auto dir = state_path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::optional<fs::path> latest;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0 || it->path().extension() != ".json") {
            continue;
        }
        // Fixed-width file-safe timestamps sort chronologically.
        if (!latest.has_value() || name > latest->filename().string()) {
            latest = it->path();
        }
    }
    return latest;
}

// ---------------------------------------------------------------------------
// CheckAndMigrate
// ---------------------------------------------------------------------------
Result<CheckAndMigrateResult, Error> SchemaMigrator::CheckAndMigrate(
    const fs::path& state_path) const {
    auto detected = DetectVersion(state_path);
    if (detected.IsErr()) {
        // Unparseable files are the store's corruption path, not ours.
        if (detected.Error().category == ErrorCategory::StateCorruption) {
            return Result<CheckAndMigrateResult, Error>::Ok(CheckAndMigrateResult{});
        }
        return Result<CheckAndMigrateResult, Error>::Err(std::move(detected).Error());
    }
    if (!detected.Value().migration_required) {
        return Result<CheckAndMigrateResult, Error>::Ok(CheckAndMigrateResult{});
    }

    auto result = Migrate(state_path);
    if (!result.success) {
        return Result<CheckAndMigrateResult, Error>::Err(MakeMigrationError(
            "CheckAndMigrate", state_path.string(), result.message));
    }
    return Result<CheckAndMigrateResult, Error>::Ok(
        CheckAndMigrateResult{true, result.backup_path});
}

} // namespace ccpm
