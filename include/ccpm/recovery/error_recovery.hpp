#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ccpm {

class StateStore;
class SchemaMigrator;

// ---------------------------------------------------------------------------
// FailureKind: the failures the coordinator knows how to handle.
// ---------------------------------------------------------------------------
enum class FailureKind {
    CloneFailed,
    NetworkError,
    Timeout,
    PermissionDenied,
    AuthenticationFailed,
    DiskFull,
    ValidationFailed,
    InvalidFormat,
    StateCorruption,
    Unknown,
};

enum class RecoveryStrategy {
    Retry,
    Skip,
    ManualIntervention,
    RestoreBackup,
    RecreateState,
    FailFast,
};

[[nodiscard]] const char* FailureKindName(FailureKind kind);
[[nodiscard]] const char* RecoveryStrategyName(RecoveryStrategy strategy);

/// Static kind -> strategy table. StateCorruption maps to RestoreBackup;
/// Recover falls back to RecreateState when no usable backup exists.
[[nodiscard]] constexpr RecoveryStrategy StrategyFor(FailureKind kind) {
    switch (kind) {
        case FailureKind::CloneFailed:
        case FailureKind::NetworkError:
        case FailureKind::Timeout:
            return RecoveryStrategy::Retry;
        case FailureKind::PermissionDenied:
        case FailureKind::AuthenticationFailed:
        case FailureKind::DiskFull:
            return RecoveryStrategy::ManualIntervention;
        case FailureKind::ValidationFailed:
        case FailureKind::InvalidFormat:
            return RecoveryStrategy::Skip;
        case FailureKind::StateCorruption:
            return RecoveryStrategy::RestoreBackup;
        case FailureKind::Unknown:
            return RecoveryStrategy::FailFast;
    }
    return RecoveryStrategy::FailFast;
}

struct RecoverableFailure {
    FailureKind kind = FailureKind::Unknown;
    std::string message;
    std::string repository;                         // may be empty
    std::optional<std::filesystem::path> state_file;
    std::optional<std::filesystem::path> backup;
};

struct RecoveryOptions {
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    bool skip_on_failure = false;
    // Copy the damaged state file aside before restoring or recreating.
    bool create_backup = false;
    // Re-runs the failed operation. Without one, Retry only counts attempts.
    std::function<Result<void, Error>()> retry;
};

struct RecoveryResult {
    bool success = false;
    RecoveryStrategy strategy = RecoveryStrategy::FailFast;
    std::string message;
    int retry_count = 0;
    std::optional<std::string> backup_used;
};

// ---------------------------------------------------------------------------
// ErrorRecovery: runs the remediation that matches a failure kind and says
// which strategy ran and whether it worked.
// ---------------------------------------------------------------------------
class ErrorRecovery {
public:
    ErrorRecovery(const Context& ctx, StateStore& store, const SchemaMigrator& migrator);

    [[nodiscard]] RecoveryResult Recover(const RecoverableFailure& failure,
                                         const RecoveryOptions& options = {});

    [[nodiscard]] bool IsRecoverable(const RecoverableFailure& failure) const;

    [[nodiscard]] std::string FormatUserMessage(const RecoverableFailure& failure) const;

    /// Map an Error category onto a failure kind.
    [[nodiscard]] static FailureKind ClassifyError(const Error& error);

    /// ClassifyError plus the error's message and path.
    [[nodiscard]] static RecoverableFailure FromError(const Error& error,
                                                      const std::string& repository = "");

private:
    RecoveryResult RunRetry(const RecoverableFailure& failure, const RecoveryOptions& options);
    RecoveryResult RecoverState(const RecoverableFailure& failure, const RecoveryOptions& options);
    /// Replace `state_file` with an empty document.
    RecoveryResult RecreateState(const std::filesystem::path& state_file);

    const Context& ctx_;
    StateStore& store_;
    const SchemaMigrator& migrator_;
};

} // namespace ccpm
