#include <ccpm/recovery/error_recovery.hpp>

#include <ccpm/core/timestamp.hpp>
#include <ccpm/state/schema_migrator.hpp>
#include <ccpm/state/state_store.hpp>

#include <thread>

namespace ccpm {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "recovery";

std::string RepositoryLabel(const RecoverableFailure& failure) {
    return failure.repository.empty() ? "repository" : failure.repository;
}

} // anonymous namespace

const char* FailureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::CloneFailed:          return "CLONE_FAILED";
        case FailureKind::NetworkError:         return "NETWORK_ERROR";
        case FailureKind::Timeout:              return "TIMEOUT_ERROR";
        case FailureKind::PermissionDenied:     return "PERMISSION_DENIED";
        case FailureKind::AuthenticationFailed: return "AUTHENTICATION_FAILED";
        case FailureKind::DiskFull:             return "DISK_FULL";
        case FailureKind::ValidationFailed:     return "VALIDATION_FAILED";
        case FailureKind::InvalidFormat:        return "INVALID_FORMAT";
        case FailureKind::StateCorruption:      return "STATE_CORRUPTION";
        case FailureKind::Unknown:              return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* RecoveryStrategyName(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::Retry:              return "retry";
        case RecoveryStrategy::Skip:               return "skip";
        case RecoveryStrategy::ManualIntervention: return "manual_intervention";
        case RecoveryStrategy::RestoreBackup:      return "restore_backup";
        case RecoveryStrategy::RecreateState:      return "recreate_state";
        case RecoveryStrategy::FailFast:           return "fail_fast";
    }
    return "fail_fast";
}

ErrorRecovery::ErrorRecovery(const Context& ctx, StateStore& store,
                             const SchemaMigrator& migrator)
    : ctx_(ctx), store_(store), migrator_(migrator) {}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------
FailureKind ErrorRecovery::ClassifyError(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Network:          return FailureKind::NetworkError;
        case ErrorCategory::Timeout:          return FailureKind::Timeout;
        // Lock contention clears on its own, like a transient network fault.
        case ErrorCategory::LockConflict:     return FailureKind::Timeout;
        case ErrorCategory::PermissionDenied: return FailureKind::PermissionDenied;
        case ErrorCategory::Authentication:   return FailureKind::AuthenticationFailed;
        case ErrorCategory::DiskFull:         return FailureKind::DiskFull;
        case ErrorCategory::Validation:       return FailureKind::ValidationFailed;
        case ErrorCategory::VersionMismatch:  return FailureKind::InvalidFormat;
        case ErrorCategory::StateCorruption:  return FailureKind::StateCorruption;
        case ErrorCategory::Io:
        case ErrorCategory::NotFound:
        case ErrorCategory::Migration:
        case ErrorCategory::Internal:
            return FailureKind::Unknown;
    }
    return FailureKind::Unknown;
}

RecoverableFailure ErrorRecovery::FromError(const Error& error, const std::string& repository) {
    RecoverableFailure failure;
    failure.kind = ClassifyError(error);
    failure.message = error.message;
    failure.repository = repository;
    if (failure.kind == FailureKind::StateCorruption && !error.path.empty()) {
        failure.state_file = fs::path(error.path);
    }
    return failure;
}

bool ErrorRecovery::IsRecoverable(const RecoverableFailure& failure) const {
    return StrategyFor(failure.kind) != RecoveryStrategy::FailFast;
}

std::string ErrorRecovery::FormatUserMessage(const RecoverableFailure& failure) const {
    std::string message;
    if (failure.kind == FailureKind::StateCorruption) {
        message = "State corruption detected:\nError: " + failure.message + "\n";
        if (failure.state_file.has_value()) {
            message += "File: " + failure.state_file->string() + "\n";
        }
        if (failure.backup.has_value()) {
            message += "Recovery: Backup available at " + failure.backup->string();
        } else {
            message += "Recovery: State will be recreated with default values";
        }
        return message;
    }

    message = "Installation failed for " + RepositoryLabel(failure) + ":\n";
    message += "Error: " + failure.message + " (" + FailureKindName(failure.kind) + ")\n";
    const auto strategy = StrategyFor(failure.kind);
    if (strategy == RecoveryStrategy::ManualIntervention || strategy == RecoveryStrategy::FailFast) {
        message += "Recovery: Manual intervention required.";
    } else {
        message += std::string("Recovery: This error is recoverable using ") +
                   RecoveryStrategyName(strategy) + " strategy.";
    }
    return message;
}

// ---------------------------------------------------------------------------
// Recover
// ---------------------------------------------------------------------------
RecoveryResult ErrorRecovery::Recover(const RecoverableFailure& failure,
                                      const RecoveryOptions& options) {
    const auto strategy = StrategyFor(failure.kind);
    ctx_.logger.Error(kComponent, std::string(FailureKindName(failure.kind)) + " for " +
                      RepositoryLabel(failure) + ": " + failure.message +
                      " (strategy " + RecoveryStrategyName(strategy) + ")");

    switch (strategy) {
        case RecoveryStrategy::Retry:
            return RunRetry(failure, options);

        case RecoveryStrategy::Skip:
            if (options.skip_on_failure) {
                return RecoveryResult{true, strategy,
                                      "Skipped installation for " + RepositoryLabel(failure) +
                                          " due to " + FailureKindName(failure.kind),
                                      0, std::nullopt};
            }
            return RecoveryResult{false, strategy,
                                  std::string("Installation failed with ") +
                                      FailureKindName(failure.kind) + ": " + failure.message,
                                  0, std::nullopt};

        case RecoveryStrategy::ManualIntervention:
            return RecoveryResult{false, strategy,
                                  std::string("Manual intervention required for ") +
                                      FailureKindName(failure.kind) + ": " + failure.message,
                                  0, std::nullopt};

        case RecoveryStrategy::RestoreBackup:
        case RecoveryStrategy::RecreateState:
            return RecoverState(failure, options);

        case RecoveryStrategy::FailFast:
            break;
    }
    return RecoveryResult{false, RecoveryStrategy::FailFast,
                          "No recovery strategy available for error: " + failure.message,
                          0, std::nullopt};
}

RecoveryResult ErrorRecovery::RunRetry(const RecoverableFailure& failure,
                                       const RecoveryOptions& options) {
    const int max_retries = options.max_retries > 0 ? options.max_retries : 3;
    int attempts = 0;
    std::string last_error = failure.message;

    while (attempts < max_retries) {
        ++attempts;
        ctx_.logger.Info(kComponent, "Retry attempt " + std::to_string(attempts) + "/" +
                         std::to_string(max_retries) + " for " + RepositoryLabel(failure));
        if (!options.retry) {
            continue;
        }
        auto outcome = options.retry();
        if (outcome.IsOk()) {
            return RecoveryResult{true, RecoveryStrategy::Retry,
                                  "Recovered after " + std::to_string(attempts) +
                                      " retry attempts",
                                  attempts, std::nullopt};
        }
        last_error = outcome.Error().message;
        if (attempts < max_retries && options.retry_delay.count() > 0) {
            std::this_thread::sleep_for(options.retry_delay);
        }
    }

    return RecoveryResult{false, RecoveryStrategy::Retry,
                          std::string("Failed to recover from ") + FailureKindName(failure.kind) +
                              " after " + std::to_string(attempts) + " retry attempts: " +
                              last_error,
                          attempts, std::nullopt};
}

RecoveryResult ErrorRecovery::RecoverState(const RecoverableFailure& failure,
                                           const RecoveryOptions& options) {
    const auto state_file = failure.state_file.value_or(store_.StatePath());
    std::error_code ec;

    if (options.create_backup && fs::exists(state_file, ec)) {
        auto aside = state_file;
        aside += ".backup." + FileSafeTimestamp(std::chrono::system_clock::now());
        fs::copy_file(state_file, aside, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            ctx_.logger.Warn(kComponent, "Failed to copy damaged state aside: " + ec.message());
        } else {
            ctx_.logger.Info(kComponent, "Damaged state copied to " + aside.string());
        }
    }

    const auto backup = failure.backup.has_value() ? failure.backup
                                                   : migrator_.FindLatestBackup(state_file);
    if (backup.has_value() && fs::exists(*backup, ec)) {
        auto restored = migrator_.RestoreFromBackup(state_file, *backup, /*verify=*/true);
        if (restored.IsOk()) {
            return RecoveryResult{true, RecoveryStrategy::RestoreBackup,
                                  "State restored from backup: " + backup->string(),
                                  0, backup->string()};
        }
        ctx_.logger.Warn(kComponent, "Failed to restore from backup " + backup->string() +
                         ": " + restored.Error().ToString());
    }

    return RecreateState(state_file);
}

RecoveryResult ErrorRecovery::RecreateState(const fs::path& state_file) {
    Result<void, Error> reset = Result<void, Error>::Ok();
    if (state_file.lexically_normal() == store_.StatePath().lexically_normal()) {
        reset = store_.ResetAll();
    } else {
        ctx_.logger.Warn(kComponent, "Resetting state file " + state_file.string());
        reset = LockedWriteFile(ctx_, state_file, SerializeJson(ToJson(StateFile::Empty())));
    }
    if (reset.IsErr()) {
        ctx_.logger.Error(kComponent, "Failed to recreate state file: " + reset.Error().ToString());
        return RecoveryResult{false, RecoveryStrategy::RecreateState,
                              "Failed to recreate state file: " + reset.Error().message,
                              0, std::nullopt};
    }
    ctx_.logger.Info(kComponent, "State file recreated at " + state_file.string());
    return RecoveryResult{true, RecoveryStrategy::RecreateState,
                          "State file recreated at " + state_file.string(),
                          0, std::nullopt};
}

} // namespace ccpm
