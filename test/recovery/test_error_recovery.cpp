#include <catch2/catch_test_macros.hpp>

#include <ccpm/recovery/error_recovery.hpp>
#include <ccpm/state/schema_migrator.hpp>
#include <ccpm/state/state_store.hpp>

#include "../../test/mocks/temp_workspace.hpp"

#include <filesystem>
#include <string>

using namespace ccpm;
using ccpm::testing::TempWorkspace;

namespace fs = std::filesystem;

namespace {

struct RecoveryFixture {
    TempWorkspace ws;
    StateStore store{ws.Ctx()};
    SchemaMigrator migrator{ws.Ctx()};
    ErrorRecovery recovery{ws.Ctx(), store, migrator};

    // Saves a state holding one repository and returns a backup copy of it.
    fs::path MakeBackup(const std::string& repo_id) {
        auto state = StateFile::Empty();
        RepositorySummary repo;
        repo.id = repo_id;
        repo.name = repo_id;
        state.repositories.push_back(repo);
        REQUIRE(store.Save(state).IsOk());
        auto backup = ws.StatePath().parent_path() / "state.backup.2024-01-01T00-00-00-000Z.json";
        fs::copy_file(ws.StatePath(), backup, fs::copy_options::overwrite_existing);
        return backup;
    }
};

Error MakeError(ErrorCategory category, const std::string& message = "boom",
                const std::string& path = "") {
    return Error{"Test", path, message, std::nullopt, category};
}

RecoveryOptions FastRetry(int max_retries = 3) {
    RecoveryOptions options;
    options.max_retries = max_retries;
    options.retry_delay = std::chrono::milliseconds(0);
    return options;
}

} // anonymous namespace

// ===========================================================================
// Classification
// ===========================================================================

TEST_CASE("ErrorRecovery: strategy table", "[recovery]") {
    CHECK(StrategyFor(FailureKind::CloneFailed) == RecoveryStrategy::Retry);
    CHECK(StrategyFor(FailureKind::NetworkError) == RecoveryStrategy::Retry);
    CHECK(StrategyFor(FailureKind::Timeout) == RecoveryStrategy::Retry);
    CHECK(StrategyFor(FailureKind::PermissionDenied) == RecoveryStrategy::ManualIntervention);
    CHECK(StrategyFor(FailureKind::AuthenticationFailed) == RecoveryStrategy::ManualIntervention);
    CHECK(StrategyFor(FailureKind::DiskFull) == RecoveryStrategy::ManualIntervention);
    CHECK(StrategyFor(FailureKind::ValidationFailed) == RecoveryStrategy::Skip);
    CHECK(StrategyFor(FailureKind::InvalidFormat) == RecoveryStrategy::Skip);
    CHECK(StrategyFor(FailureKind::StateCorruption) == RecoveryStrategy::RestoreBackup);
    CHECK(StrategyFor(FailureKind::Unknown) == RecoveryStrategy::FailFast);
    static_assert(StrategyFor(FailureKind::Unknown) == RecoveryStrategy::FailFast);
}

TEST_CASE("ErrorRecovery: names", "[recovery]") {
    CHECK(std::string(FailureKindName(FailureKind::Timeout)) == "TIMEOUT_ERROR");
    CHECK(std::string(FailureKindName(FailureKind::CloneFailed)) == "CLONE_FAILED");
    CHECK(std::string(RecoveryStrategyName(RecoveryStrategy::ManualIntervention)) ==
          "manual_intervention");
    CHECK(std::string(RecoveryStrategyName(RecoveryStrategy::RecreateState)) == "recreate_state");
}

TEST_CASE("ErrorRecovery: classify error categories", "[recovery]") {
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::Network)) ==
          FailureKind::NetworkError);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::LockConflict)) ==
          FailureKind::Timeout);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::Authentication)) ==
          FailureKind::AuthenticationFailed);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::VersionMismatch)) ==
          FailureKind::InvalidFormat);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::StateCorruption)) ==
          FailureKind::StateCorruption);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::Io)) == FailureKind::Unknown);
    CHECK(ErrorRecovery::ClassifyError(MakeError(ErrorCategory::Internal)) ==
          FailureKind::Unknown);
}

TEST_CASE("ErrorRecovery: FromError carries message and state path", "[recovery]") {
    auto corrupt = ErrorRecovery::FromError(
        MakeError(ErrorCategory::StateCorruption, "bad json", "/tmp/state.json"), "repo");
    CHECK(corrupt.kind == FailureKind::StateCorruption);
    CHECK(corrupt.message == "bad json");
    CHECK(corrupt.repository == "repo");
    REQUIRE(corrupt.state_file.has_value());
    CHECK(*corrupt.state_file == fs::path("/tmp/state.json"));

    auto network = ErrorRecovery::FromError(MakeError(ErrorCategory::Network, "x", "/some/path"));
    CHECK_FALSE(network.state_file.has_value());
}

TEST_CASE("ErrorRecovery: IsRecoverable", "[recovery]") {
    RecoveryFixture f;
    CHECK(f.recovery.IsRecoverable({FailureKind::NetworkError, "x", "", {}, {}}));
    CHECK(f.recovery.IsRecoverable({FailureKind::DiskFull, "x", "", {}, {}}));
    CHECK_FALSE(f.recovery.IsRecoverable({FailureKind::Unknown, "x", "", {}, {}}));
}

// ===========================================================================
// Retry
// ===========================================================================

TEST_CASE("ErrorRecovery: retry succeeds on a later attempt", "[recovery][retry]") {
    RecoveryFixture f;
    int calls = 0;
    auto options = FastRetry();
    options.retry = [&calls]() {
        ++calls;
        if (calls < 2) {
            return Result<void, Error>::Err(MakeError(ErrorCategory::Network, "still down"));
        }
        return Result<void, Error>::Ok();
    };

    auto result = f.recovery.Recover({FailureKind::CloneFailed, "clone failed", "repo", {}, {}},
                                     options);
    CHECK(result.success);
    CHECK(result.strategy == RecoveryStrategy::Retry);
    CHECK(result.retry_count == 2);
    CHECK(calls == 2);
}

TEST_CASE("ErrorRecovery: retry gives up after max attempts", "[recovery][retry]") {
    RecoveryFixture f;
    int calls = 0;
    auto options = FastRetry(4);
    options.retry = [&calls]() {
        ++calls;
        return Result<void, Error>::Err(MakeError(ErrorCategory::Timeout, "timed out"));
    };

    auto result = f.recovery.Recover({FailureKind::Timeout, "first", "repo", {}, {}}, options);
    CHECK_FALSE(result.success);
    CHECK(result.retry_count == 4);
    CHECK(calls == 4);
    CHECK(result.message.find("timed out") != std::string::npos);
    CHECK(result.message.find("TIMEOUT_ERROR") != std::string::npos);
}

TEST_CASE("ErrorRecovery: retry without an operation only counts", "[recovery][retry]") {
    RecoveryFixture f;
    auto result = f.recovery.Recover({FailureKind::NetworkError, "offline", "", {}, {}},
                                     FastRetry());
    CHECK_FALSE(result.success);
    CHECK(result.retry_count == 3);
}

// ===========================================================================
// Skip, manual and fail-fast
// ===========================================================================

TEST_CASE("ErrorRecovery: skip honours skip_on_failure", "[recovery]") {
    RecoveryFixture f;
    RecoverableFailure failure{FailureKind::ValidationFailed, "bad layout", "repo", {}, {}};

    auto refused = f.recovery.Recover(failure);
    CHECK_FALSE(refused.success);
    CHECK(refused.strategy == RecoveryStrategy::Skip);

    RecoveryOptions options;
    options.skip_on_failure = true;
    auto skipped = f.recovery.Recover(failure, options);
    CHECK(skipped.success);
    CHECK(skipped.message.find("Skipped installation for repo") != std::string::npos);
}

TEST_CASE("ErrorRecovery: manual intervention never succeeds", "[recovery]") {
    RecoveryFixture f;
    auto result = f.recovery.Recover({FailureKind::PermissionDenied, "EACCES", "", {}, {}});
    CHECK_FALSE(result.success);
    CHECK(result.strategy == RecoveryStrategy::ManualIntervention);
    CHECK(result.message.find("PERMISSION_DENIED") != std::string::npos);
}

TEST_CASE("ErrorRecovery: unknown failures fail fast", "[recovery]") {
    RecoveryFixture f;
    auto result = f.recovery.Recover({FailureKind::Unknown, "weird", "", {}, {}});
    CHECK_FALSE(result.success);
    CHECK(result.strategy == RecoveryStrategy::FailFast);
    CHECK(result.message == "No recovery strategy available for error: weird");
}

// ===========================================================================
// State corruption
// ===========================================================================

TEST_CASE("ErrorRecovery: corruption restores the latest backup", "[recovery][state]") {
    RecoveryFixture f;
    const auto backup = f.MakeBackup("from-backup");
    TempWorkspace::WriteFile(f.ws.StatePath(), "{ not json");

    auto result = f.recovery.Recover(
        {FailureKind::StateCorruption, "parse error", "", f.ws.StatePath(), std::nullopt});
    REQUIRE(result.success);
    CHECK(result.strategy == RecoveryStrategy::RestoreBackup);
    CHECK(result.backup_used == std::optional<std::string>(backup.string()));

    auto loaded = f.store.Load();
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().HasRepository("from-backup"));
}

TEST_CASE("ErrorRecovery: corruption without backup recreates state", "[recovery][state]") {
    RecoveryFixture f;
    TempWorkspace::WriteFile(f.ws.StatePath(), "{ not json");

    auto result = f.recovery.Recover(
        {FailureKind::StateCorruption, "parse error", "", f.ws.StatePath(), std::nullopt});
    REQUIRE(result.success);
    CHECK(result.strategy == RecoveryStrategy::RecreateState);

    auto loaded = f.store.Load();
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().repositories.empty());
}

TEST_CASE("ErrorRecovery: invalid backup falls back to recreation", "[recovery][state]") {
    RecoveryFixture f;
    const auto backup = f.ws.StatePath().parent_path() / "broken-backup.json";
    TempWorkspace::WriteFile(backup, "also broken");
    TempWorkspace::WriteFile(f.ws.StatePath(), "{ not json");

    auto result = f.recovery.Recover(
        {FailureKind::StateCorruption, "parse error", "", f.ws.StatePath(), backup});
    CHECK(result.success);
    CHECK(result.strategy == RecoveryStrategy::RecreateState);
}

TEST_CASE("ErrorRecovery: create_backup copies the damaged file aside", "[recovery][state]") {
    RecoveryFixture f;
    TempWorkspace::WriteFile(f.ws.StatePath(), "damaged bytes");

    RecoveryOptions options;
    options.create_backup = true;
    auto result = f.recovery.Recover(
        {FailureKind::StateCorruption, "parse error", "", f.ws.StatePath(), std::nullopt}, options);
    REQUIRE(result.success);

    bool found = false;
    const auto prefix = f.ws.StatePath().filename().string() + ".backup.";
    for (const auto& entry : fs::directory_iterator(f.ws.StatePath().parent_path())) {
        const auto name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0) {
            found = true;
            CHECK(TempWorkspace::ReadFile(entry.path()) == "damaged bytes");
        }
    }
    CHECK(found);
}

TEST_CASE("ErrorRecovery: recreation resets the failing file, not the default", "[recovery][state]") {
    RecoveryFixture f;
    auto state = StateFile::Empty();
    RepositorySummary repo;
    repo.id = "kept";
    state.repositories.push_back(repo);
    REQUIRE(f.store.Save(state).IsOk());
    const auto elsewhere = f.ws.Root() / "elsewhere" / "state.json";
    TempWorkspace::WriteFile(elsewhere, "{ not json");

    auto result = f.recovery.Recover(
        {FailureKind::StateCorruption, "parse error", "", elsewhere, std::nullopt});
    REQUIRE(result.success);
    CHECK(result.strategy == RecoveryStrategy::RecreateState);
    CHECK(result.message.find(elsewhere.string()) != std::string::npos);

    auto recreated = StateFileFromJson(nlohmann::json::parse(TempWorkspace::ReadFile(elsewhere)));
    REQUIRE(recreated.IsOk());
    CHECK(recreated.Value().repositories.empty());
    CHECK_FALSE(fs::exists(StateLockPath(elsewhere)));

    auto loaded = f.store.Load();
    REQUIRE(loaded.IsOk());
    CHECK(loaded.Value().HasRepository("kept"));
}

// ===========================================================================
// User messages
// ===========================================================================

TEST_CASE("ErrorRecovery: user message for install failures", "[recovery]") {
    RecoveryFixture f;

    auto retryable = f.recovery.FormatUserMessage(
        {FailureKind::NetworkError, "host unreachable", "my-repo", {}, {}});
    CHECK(retryable ==
          "Installation failed for my-repo:\n"
          "Error: host unreachable (NETWORK_ERROR)\n"
          "Recovery: This error is recoverable using retry strategy.");

    auto manual = f.recovery.FormatUserMessage({FailureKind::DiskFull, "ENOSPC", "", {}, {}});
    CHECK(manual.find("Installation failed for repository:") == 0);
    CHECK(manual.find("Recovery: Manual intervention required.") != std::string::npos);
}

TEST_CASE("ErrorRecovery: user message for corruption", "[recovery]") {
    RecoveryFixture f;

    auto with_backup = f.recovery.FormatUserMessage(
        {FailureKind::StateCorruption, "bad json", "", fs::path("/s/state.json"),
         fs::path("/s/state.backup.json")});
    CHECK(with_backup ==
          "State corruption detected:\n"
          "Error: bad json\n"
          "File: /s/state.json\n"
          "Recovery: Backup available at /s/state.backup.json");

    auto without = f.recovery.FormatUserMessage(
        {FailureKind::StateCorruption, "bad json", "", std::nullopt, std::nullopt});
    CHECK(without.find("State will be recreated with default values") != std::string::npos);
    CHECK(without.find("File:") == std::string::npos);
}
