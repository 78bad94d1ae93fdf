#pragma once

#include <ccpm/core/result.hpp>
#include <ccpm/core/types.hpp>
#include <ccpm/deploy/deploy_types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ccpm {

constexpr int kCurrentStateVersion = 2;

// Registry record of a repository, as persisted in the state file.
struct RepositorySummary {
    std::string id;
    std::string name;
    std::string url;
    std::optional<std::string> local_path;
    std::string registered_at;
    std::string status = "active";   // active | error | uninitialized
    std::optional<TargetType> type;
    std::optional<std::string> deployment_mode;
};

struct DeploymentMetadata {
    int total_installations = 0;
    int total_uninstallations = 0;
    std::optional<std::string> first_installed;
    std::optional<std::string> last_commit_hash;
};

struct DeploymentState {
    std::string repository_id;
    std::vector<DeployedFile> deployed_files;
    InstallationStatus installation_status = InstallationStatus::Installed;
    std::optional<std::string> last_installed;
    std::optional<std::string> last_uninstalled;
    std::vector<std::string> errors;
    std::optional<DeploymentMetadata> metadata;
};

struct RecordMetadata {
    std::optional<std::string> commit_hash;
    std::optional<std::string> user_agent;
};

// Append-only audit entry.
struct InstallationRecord {
    std::string id;
    std::string repository_id;
    InstallationOperation operation = InstallationOperation::Install;
    std::string timestamp;
    int files_affected = 0;
    bool success = true;
    std::optional<std::string> error;
    std::optional<nlohmann::json> options;
    std::optional<RecordMetadata> metadata;
};

struct StateMetadata {
    std::string last_updated;
    std::optional<std::string> last_migration;
};

// The whole persisted document.
struct StateFile {
    int version = kCurrentStateVersion;
    std::vector<RepositorySummary> repositories;
    std::map<std::string, DeploymentState> deployment_states;
    std::vector<InstallationRecord> installation_history;
    StateMetadata metadata;

    /// Empty current-schema document stamped with the current time.
    static StateFile Empty();

    [[nodiscard]] const RepositorySummary* FindRepository(const std::string& id) const;
    [[nodiscard]] bool HasRepository(const std::string& id) const {
        return FindRepository(id) != nullptr;
    }
};

// ---------------------------------------------------------------------------
// JsonFieldReader: typed reads of one JSON object's fields.
//
// An absent or null field yields the fallback. A field holding any other
// wrong type also yields the fallback and records the first mismatch, so a
// decoder reads every field and checks Mismatch() once at the end.
// ---------------------------------------------------------------------------
class JsonFieldReader {
public:
    JsonFieldReader(const nlohmann::json& object, std::string context);

    std::string String(const char* key, const std::string& fallback = "");
    std::optional<std::string> OptionalString(const char* key);
    int Int(const char* key, int fallback);
    bool Bool(const char* key, bool fallback);
    /// Array of strings; absent or null is empty.
    std::vector<std::string> StringArray(const char* key);

    /// "<context>: field '<key>' must be a string, got number".
    [[nodiscard]] const std::optional<std::string>& Mismatch() const noexcept {
        return mismatch_;
    }

private:
    // Null for an absent or null field.
    const nlohmann::json* Find(const char* key) const;
    void RecordMismatch(const char* key, const char* expected, const nlohmann::json& value);

    const nlohmann::json& object_;
    std::string context_;
    std::optional<std::string> mismatch_;
};

// ---------------------------------------------------------------------------
// JSON codec. Keys are camelCase on disk; optional fields are omitted when
// unset. Decoding returns StateCorruption on a structurally invalid document,
// including a field of the wrong type.
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const DeployedFile& file);
nlohmann::json ToJson(const DeploymentResult& result);
nlohmann::json ToJson(const RepositorySummary& repository);
nlohmann::json ToJson(const DeploymentState& state);
nlohmann::json ToJson(const InstallationRecord& record);
nlohmann::json ToJson(const StateFile& state);

Result<DeployedFile, Error> DeployedFileFromJson(const nlohmann::json& j);
Result<RepositorySummary, Error> RepositorySummaryFromJson(const nlohmann::json& j);
Result<DeploymentState, Error> DeploymentStateFromJson(const nlohmann::json& j);
Result<InstallationRecord, Error> InstallationRecordFromJson(const nlohmann::json& j);
Result<StateFile, Error> StateFileFromJson(const nlohmann::json& j);

} // namespace ccpm
