#pragma once

#include <ccpm/core/result.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace ccpm {

// ---------------------------------------------------------------------------
// RepositoryId: stable repository identifier issued by the registry.
//
// Rules:
//   - Non-empty, max 128 characters
//   - ASCII letters, digits, '-', '_', '.'
//   - Must not be "." or ".." (ids appear in backup and export file names)
// ---------------------------------------------------------------------------
class RepositoryId {
public:
    static Result<RepositoryId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const RepositoryId& other) const { return value_ == other.value_; }
    bool operator!=(const RepositoryId& other) const { return value_ != other.value_; }

    RepositoryId(const RepositoryId&) = default;
    RepositoryId& operator=(const RepositoryId&) = default;
    RepositoryId(RepositoryId&&) noexcept = default;
    RepositoryId& operator=(RepositoryId&&) noexcept = default;

private:
    explicit RepositoryId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// TargetType: deployment category. The name doubles as the subdirectory
// under the extension root.
// ---------------------------------------------------------------------------
enum class TargetType {
    Commands,
    Agents,
    Hooks,
};

constexpr std::array<TargetType, 3> kAllTargetTypes = {
    TargetType::Commands, TargetType::Agents, TargetType::Hooks};

[[nodiscard]] const char* TargetTypeName(TargetType type);
[[nodiscard]] std::optional<TargetType> ParseTargetType(std::string_view name);

// ---------------------------------------------------------------------------
// InstallationStatus: lifecycle of a repository's deployment.
// ---------------------------------------------------------------------------
enum class InstallationStatus {
    Installed,
    Partial,
    Uninstalled,
    Error,
};

[[nodiscard]] const char* InstallationStatusName(InstallationStatus status);
[[nodiscard]] std::optional<InstallationStatus> ParseInstallationStatus(std::string_view name);

// ---------------------------------------------------------------------------
// InstallationOperation: kind of audit record.
// ---------------------------------------------------------------------------
enum class InstallationOperation {
    Install,
    Uninstall,
    Unregister,
};

[[nodiscard]] const char* InstallationOperationName(InstallationOperation op);
[[nodiscard]] std::optional<InstallationOperation> ParseInstallationOperation(std::string_view name);

} // namespace ccpm
