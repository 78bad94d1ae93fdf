#pragma once

#include <ccpm/config/app_config.hpp>
#include <ccpm/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ccpm {

constexpr const char* kTypeBasedMode = "type-based";

// Repository handed to the engine by the registry.
struct RepositoryRef {
    std::string id;
    std::string name;
    std::string local_path;
    std::optional<TargetType> type;
    std::optional<std::string> deployment_mode;   // "type-based" or unset

    [[nodiscard]] bool IsTypeBased() const {
        return type.has_value() && deployment_mode.has_value() &&
               *deployment_mode == kTypeBasedMode;
    }
};

struct DeployOptions {
    bool interactive = false;
    // Overrides the configured default when not interactive.
    std::optional<ConflictStrategy> strategy;
};

// One file materialized in the extension directory.
struct DeployedFile {
    std::string source;        // relative to the repository root
    std::string target;        // absolute
    std::string hash;          // SHA-256 of the bytes at target
    std::string deployed_at;   // ISO-8601
    std::optional<TargetType> type;
    // Target relative to the extension root's parent: ".claude/commands/x.md".
    std::string path;

    bool operator==(const DeployedFile& other) const {
        return source == other.source && target == other.target &&
               hash == other.hash && deployed_at == other.deployed_at &&
               type == other.type && path == other.path;
    }
};

struct DeploymentResult {
    std::vector<DeployedFile> deployed;
    std::vector<std::string> skipped;
    std::vector<std::string> failed;
    // Every match whose target already existed, whatever was decided.
    std::vector<std::string> conflicts;
};

} // namespace ccpm
