#include <ccpm/state/state_types.hpp>

#include <ccpm/core/timestamp.hpp>

#include <algorithm>

namespace ccpm {

using nlohmann::json;

namespace {

Error MakeCodecError(const std::string& message) {
    return Error{"StateCodec", "", message, std::nullopt, ErrorCategory::StateCorruption};
}

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = *value;
    }
}

json ToStringArray(const std::vector<std::string>& values) {
    json arr = json::array();
    for (const auto& v : values) {
        arr.push_back(v);
    }
    return arr;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// StateFile helpers
// ---------------------------------------------------------------------------
StateFile StateFile::Empty() {
    StateFile state;
    state.metadata.last_updated = Iso8601Now();
    return state;
}

const RepositorySummary* StateFile::FindRepository(const std::string& id) const {
    auto it = std::find_if(repositories.begin(), repositories.end(),
                           [&id](const RepositorySummary& r) { return r.id == id; });
    return it == repositories.end() ? nullptr : &*it;
}

// ---------------------------------------------------------------------------
// JsonFieldReader
// ---------------------------------------------------------------------------
JsonFieldReader::JsonFieldReader(const json& object, std::string context)
    : object_(object), context_(std::move(context)) {}

const json* JsonFieldReader::Find(const char* key) const {
    if (!object_.is_object()) {
        return nullptr;
    }
    auto it = object_.find(key);
    if (it == object_.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

void JsonFieldReader::RecordMismatch(const char* key, const char* expected, const json& value) {
    if (!mismatch_.has_value()) {
        mismatch_ = context_ + ": field '" + key + "' must be " + expected + ", got " +
                    value.type_name();
    }
}

std::string JsonFieldReader::String(const char* key, const std::string& fallback) {
    const auto* v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->is_string()) {
        RecordMismatch(key, "a string", *v);
        return fallback;
    }
    return v->get<std::string>();
}

std::optional<std::string> JsonFieldReader::OptionalString(const char* key) {
    const auto* v = Find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->is_string()) {
        RecordMismatch(key, "a string", *v);
        return std::nullopt;
    }
    return v->get<std::string>();
}

int JsonFieldReader::Int(const char* key, int fallback) {
    const auto* v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->is_number_integer()) {
        RecordMismatch(key, "an integer", *v);
        return fallback;
    }
    return v->get<int>();
}

bool JsonFieldReader::Bool(const char* key, bool fallback) {
    const auto* v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->is_boolean()) {
        RecordMismatch(key, "a boolean", *v);
        return fallback;
    }
    return v->get<bool>();
}

std::vector<std::string> JsonFieldReader::StringArray(const char* key) {
    std::vector<std::string> out;
    const auto* v = Find(key);
    if (v == nullptr) {
        return out;
    }
    if (!v->is_array()) {
        RecordMismatch(key, "an array", *v);
        return out;
    }
    for (const auto& e : *v) {
        if (!e.is_string()) {
            RecordMismatch(key, "an array of strings", e);
            return {};
        }
        out.push_back(e.get<std::string>());
    }
    return out;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
json ToJson(const DeployedFile& file) {
    json j;
    j["path"] = file.path;
    j["source"] = file.source;
    j["target"] = file.target;
    j["hash"] = file.hash;
    j["deployedAt"] = file.deployed_at;
    if (file.type.has_value()) {
        j["type"] = TargetTypeName(*file.type);
    }
    return j;
}

json ToJson(const DeploymentResult& result) {
    json deployed = json::array();
    for (const auto& f : result.deployed) {
        deployed.push_back(ToJson(f));
    }
    json j;
    j["deployed"] = std::move(deployed);
    j["skipped"] = ToStringArray(result.skipped);
    j["failed"] = ToStringArray(result.failed);
    j["conflicts"] = ToStringArray(result.conflicts);
    return j;
}

json ToJson(const RepositorySummary& repository) {
    json j;
    j["id"] = repository.id;
    j["name"] = repository.name;
    j["url"] = repository.url;
    PutOptional(j, "localPath", repository.local_path);
    j["registeredAt"] = repository.registered_at;
    j["status"] = repository.status;
    if (repository.type.has_value()) {
        j["type"] = TargetTypeName(*repository.type);
    }
    PutOptional(j, "deploymentMode", repository.deployment_mode);
    return j;
}

json ToJson(const DeploymentState& state) {
    json files = json::array();
    for (const auto& f : state.deployed_files) {
        files.push_back(ToJson(f));
    }

    json j;
    j["repositoryId"] = state.repository_id;
    j["deployedFiles"] = std::move(files);
    j["installationStatus"] = InstallationStatusName(state.installation_status);
    PutOptional(j, "lastInstalled", state.last_installed);
    PutOptional(j, "lastUninstalled", state.last_uninstalled);
    if (!state.errors.empty()) {
        j["errors"] = ToStringArray(state.errors);
    }
    if (state.metadata.has_value()) {
        const auto& m = *state.metadata;
        json meta;
        meta["totalInstallations"] = m.total_installations;
        meta["totalUninstallations"] = m.total_uninstallations;
        PutOptional(meta, "firstInstalled", m.first_installed);
        PutOptional(meta, "lastCommitHash", m.last_commit_hash);
        j["metadata"] = std::move(meta);
    }
    return j;
}

json ToJson(const InstallationRecord& record) {
    json j;
    j["id"] = record.id;
    j["repositoryId"] = record.repository_id;
    j["operation"] = InstallationOperationName(record.operation);
    j["timestamp"] = record.timestamp;
    j["filesAffected"] = record.files_affected;
    j["success"] = record.success;
    PutOptional(j, "error", record.error);
    if (record.options.has_value()) {
        j["options"] = *record.options;
    }
    if (record.metadata.has_value()) {
        json meta = json::object();
        PutOptional(meta, "commitHash", record.metadata->commit_hash);
        PutOptional(meta, "userAgent", record.metadata->user_agent);
        j["metadata"] = std::move(meta);
    }
    return j;
}

json ToJson(const StateFile& state) {
    json repositories = json::array();
    for (const auto& r : state.repositories) {
        repositories.push_back(ToJson(r));
    }
    json states = json::object();
    for (const auto& [id, s] : state.deployment_states) {
        states[id] = ToJson(s);
    }
    json history = json::array();
    for (const auto& rec : state.installation_history) {
        history.push_back(ToJson(rec));
    }

    json j;
    j["version"] = state.version;
    j["repositories"] = std::move(repositories);
    j["deploymentStates"] = std::move(states);
    j["installationHistory"] = std::move(history);
    j["metadata"]["lastUpdated"] = state.metadata.last_updated;
    if (state.metadata.last_migration.has_value()) {
        j["metadata"]["lastMigration"] = *state.metadata.last_migration;
    } else {
        j["metadata"]["lastMigration"] = nullptr;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
namespace {

template <typename T>
Result<T, Error> Finish(const JsonFieldReader& fields, T value) {
    if (fields.Mismatch().has_value()) {
        return Result<T, Error>::Err(MakeCodecError(*fields.Mismatch()));
    }
    return Result<T, Error>::Ok(std::move(value));
}

// Legacy files carry singular type names ("command"); ParseTargetType accepts both.
std::optional<TargetType> ReadType(JsonFieldReader& fields, const char* key) {
    auto name = fields.OptionalString(key);
    if (!name.has_value()) {
        return std::nullopt;
    }
    return ParseTargetType(*name);
}

} // anonymous namespace

Result<DeployedFile, Error> DeployedFileFromJson(const json& j) {
    if (!j.is_object()) {
        return Result<DeployedFile, Error>::Err(MakeCodecError("Deployed file is not an object"));
    }
    JsonFieldReader fields(j, "deployed file");
    DeployedFile file;
    file.source = fields.String("source");
    file.target = fields.String("target");
    file.hash = fields.String("hash");
    file.deployed_at = fields.String("deployedAt");
    file.type = ReadType(fields, "type");
    file.path = fields.String("path", file.target);
    if (file.target.empty()) {
        file.target = file.path;
    }
    return Finish(fields, std::move(file));
}

Result<RepositorySummary, Error> RepositorySummaryFromJson(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return Result<RepositorySummary, Error>::Err(
            MakeCodecError("Repository entry without a string id"));
    }
    RepositorySummary r;
    r.id = j["id"].get<std::string>();
    JsonFieldReader fields(j, "repository " + r.id);
    r.name = fields.String("name", r.id);
    r.url = fields.String("url");
    r.local_path = fields.OptionalString("localPath");
    r.registered_at = fields.String("registeredAt");
    r.status = fields.String("status", "active");
    r.type = ReadType(fields, "type");
    r.deployment_mode = fields.OptionalString("deploymentMode");
    return Finish(fields, std::move(r));
}

Result<DeploymentState, Error> DeploymentStateFromJson(const json& j) {
    if (!j.is_object()) {
        return Result<DeploymentState, Error>::Err(
            MakeCodecError("Deployment state is not an object"));
    }
    JsonFieldReader fields(j, "deployment state");
    DeploymentState s;
    s.repository_id = fields.String("repositoryId");

    if (auto it = j.find("deployedFiles"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Result<DeploymentState, Error>::Err(
                MakeCodecError("deployedFiles is not an array"));
        }
        for (const auto& entry : *it) {
            auto file = DeployedFileFromJson(entry);
            if (file.IsErr()) {
                return Result<DeploymentState, Error>::Err(file.Error());
            }
            s.deployed_files.push_back(std::move(file).Value());
        }
    }

    const auto status_name = fields.String("installationStatus", "installed");
    auto status = ParseInstallationStatus(status_name);
    if (!status.has_value()) {
        return Result<DeploymentState, Error>::Err(
            MakeCodecError("Unknown installationStatus for " + s.repository_id));
    }
    s.installation_status = *status;
    s.last_installed = fields.OptionalString("lastInstalled");
    s.last_uninstalled = fields.OptionalString("lastUninstalled");
    s.errors = fields.StringArray("errors");

    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        JsonFieldReader meta_fields(*it, "deployment metadata");
        DeploymentMetadata m;
        m.total_installations = meta_fields.Int("totalInstallations", 0);
        m.total_uninstallations = meta_fields.Int("totalUninstallations", 0);
        m.first_installed = meta_fields.OptionalString("firstInstalled");
        m.last_commit_hash = meta_fields.OptionalString("lastCommitHash");
        if (meta_fields.Mismatch().has_value()) {
            return Result<DeploymentState, Error>::Err(MakeCodecError(*meta_fields.Mismatch()));
        }
        s.metadata = std::move(m);
    }
    return Finish(fields, std::move(s));
}

Result<InstallationRecord, Error> InstallationRecordFromJson(const json& j) {
    if (!j.is_object()) {
        return Result<InstallationRecord, Error>::Err(
            MakeCodecError("History record is not an object"));
    }
    JsonFieldReader fields(j, "history record");
    InstallationRecord r;
    r.id = fields.String("id");
    r.repository_id = fields.String("repositoryId");
    const auto op_name = fields.String("operation");
    r.timestamp = fields.String("timestamp");
    r.files_affected = fields.Int("filesAffected", 0);
    r.success = fields.Bool("success", true);
    r.error = fields.OptionalString("error");
    if (fields.Mismatch().has_value()) {
        return Result<InstallationRecord, Error>::Err(MakeCodecError(*fields.Mismatch()));
    }
    auto op = ParseInstallationOperation(op_name);
    if (!op.has_value()) {
        return Result<InstallationRecord, Error>::Err(
            MakeCodecError("Unknown operation in history record " + r.id));
    }
    r.operation = *op;
    if (auto it = j.find("options"); it != j.end() && it->is_object()) {
        r.options = *it;
    }
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        JsonFieldReader meta_fields(*it, "history record metadata");
        RecordMetadata m;
        m.commit_hash = meta_fields.OptionalString("commitHash");
        m.user_agent = meta_fields.OptionalString("userAgent");
        if (meta_fields.Mismatch().has_value()) {
            return Result<InstallationRecord, Error>::Err(MakeCodecError(*meta_fields.Mismatch()));
        }
        r.metadata = std::move(m);
    }
    return Result<InstallationRecord, Error>::Ok(std::move(r));
}

namespace {

bool IsVersionObject(const json& version, const char* format) {
    if (!version.is_object()) {
        return false;
    }
    auto it = version.find("format");
    return it != version.end() && it->is_string() && it->get<std::string>() == format;
}

} // anonymous namespace

Result<StateFile, Error> StateFileFromJson(const json& j) {
    if (!j.is_object()) {
        return Result<StateFile, Error>::Err(MakeCodecError("State document is not an object"));
    }
    StateFile state;

    auto version = j.find("version");
    if (version != j.end() && version->is_number_integer()) {
        state.version = version->get<int>();
    } else if (version != j.end() && IsVersionObject(*version, "v2")) {
        state.version = kCurrentStateVersion;
    } else {
        return Result<StateFile, Error>::Err(
            MakeCodecError("State document has no numeric version"));
    }
    if (state.version != kCurrentStateVersion) {
        return Result<StateFile, Error>::Err(Error{
            "StateCodec", "", "Unsupported state version " + std::to_string(state.version),
            std::nullopt, ErrorCategory::VersionMismatch});
    }

    if (auto it = j.find("repositories"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Result<StateFile, Error>::Err(MakeCodecError("repositories is not an array"));
        }
        for (const auto& entry : *it) {
            auto repo = RepositorySummaryFromJson(entry);
            if (repo.IsErr()) {
                return Result<StateFile, Error>::Err(repo.Error());
            }
            state.repositories.push_back(std::move(repo).Value());
        }
    }

    if (auto it = j.find("deploymentStates"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Result<StateFile, Error>::Err(
                MakeCodecError("deploymentStates is not an object"));
        }
        for (auto entry = it->begin(); entry != it->end(); ++entry) {
            auto ds = DeploymentStateFromJson(entry.value());
            if (ds.IsErr()) {
                return Result<StateFile, Error>::Err(ds.Error());
            }
            auto value = std::move(ds).Value();
            if (value.repository_id.empty()) {
                value.repository_id = entry.key();
            }
            state.deployment_states.emplace(entry.key(), std::move(value));
        }
    }

    if (auto it = j.find("installationHistory"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Result<StateFile, Error>::Err(
                MakeCodecError("installationHistory is not an array"));
        }
        for (const auto& entry : *it) {
            auto rec = InstallationRecordFromJson(entry);
            if (rec.IsErr()) {
                return Result<StateFile, Error>::Err(rec.Error());
            }
            state.installation_history.push_back(std::move(rec).Value());
        }
    }

    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        JsonFieldReader fields(*it, "state metadata");
        state.metadata.last_updated = fields.String("lastUpdated");
        state.metadata.last_migration = fields.OptionalString("lastMigration");
        if (fields.Mismatch().has_value()) {
            return Result<StateFile, Error>::Err(MakeCodecError(*fields.Mismatch()));
        }
    }
    return Result<StateFile, Error>::Ok(std::move(state));
}

} // namespace ccpm
