#include <ccpm/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace ccpm {

namespace {

bool IsIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RepositoryId
// ---------------------------------------------------------------------------
Result<RepositoryId, std::string> RepositoryId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<RepositoryId, std::string>::Err("Repository id must not be empty");
    }
    if (id.size() > 128) {
        return Result<RepositoryId, std::string>::Err(
            "Repository id must be at most 128 characters, got " +
            std::to_string(id.size()));
    }
    if (id == "." || id == "..") {
        return Result<RepositoryId, std::string>::Err(
            "Repository id must not be '.' or '..'");
    }
    if (!std::all_of(id.begin(), id.end(), IsIdChar)) {
        return Result<RepositoryId, std::string>::Err(
            "Repository id must contain only letters, digits, '-', '_' and '.'");
    }
    return Result<RepositoryId, std::string>::Ok(RepositoryId(std::string(id)));
}

// ---------------------------------------------------------------------------
// TargetType
// ---------------------------------------------------------------------------
const char* TargetTypeName(TargetType type) {
    switch (type) {
        case TargetType::Commands: return "commands";
        case TargetType::Agents:   return "agents";
        case TargetType::Hooks:    return "hooks";
    }
    return "commands";
}

std::optional<TargetType> ParseTargetType(std::string_view name) {
    // The singular forms appear in older state files ("command", "agent").
    if (name == "commands" || name == "command") return TargetType::Commands;
    if (name == "agents" || name == "agent") return TargetType::Agents;
    if (name == "hooks" || name == "hook") return TargetType::Hooks;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// InstallationStatus
// ---------------------------------------------------------------------------
const char* InstallationStatusName(InstallationStatus status) {
    switch (status) {
        case InstallationStatus::Installed:   return "installed";
        case InstallationStatus::Partial:     return "partial";
        case InstallationStatus::Uninstalled: return "uninstalled";
        case InstallationStatus::Error:       return "error";
    }
    return "error";
}

std::optional<InstallationStatus> ParseInstallationStatus(std::string_view name) {
    if (name == "installed") return InstallationStatus::Installed;
    if (name == "partial") return InstallationStatus::Partial;
    if (name == "uninstalled") return InstallationStatus::Uninstalled;
    if (name == "error") return InstallationStatus::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// InstallationOperation
// ---------------------------------------------------------------------------
const char* InstallationOperationName(InstallationOperation op) {
    switch (op) {
        case InstallationOperation::Install:    return "install";
        case InstallationOperation::Uninstall:  return "uninstall";
        case InstallationOperation::Unregister: return "unregister";
    }
    return "install";
}

std::optional<InstallationOperation> ParseInstallationOperation(std::string_view name) {
    if (name == "install") return InstallationOperation::Install;
    if (name == "uninstall") return InstallationOperation::Uninstall;
    if (name == "unregister") return InstallationOperation::Unregister;
    return std::nullopt;
}

} // namespace ccpm
