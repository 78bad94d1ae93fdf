#pragma once

#include <ccpm/config/context.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/state/state_types.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ccpm {

// ---------------------------------------------------------------------------
// LockFile: RAII wrapper for the state lock.
//
// Acquire creates the lock with O_CREAT|O_EXCL and writes {pid, timestamp}.
// While the file exists it sleeps `retry_delay` and tries again, at most
// `max_attempts` times, then fails with LockConflict. The destructor removes
// the file. Stale locks are never reclaimed.
// ---------------------------------------------------------------------------
class LockFile {
public:
    [[nodiscard]] static Result<LockFile, Error> Acquire(
        const std::filesystem::path& lock_path,
        int max_attempts,
        std::chrono::milliseconds retry_delay);

    ~LockFile();

    // Non-copyable, movable.
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
    LockFile(LockFile&& other) noexcept;
    LockFile& operator=(LockFile&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    /// Remove the lock now instead of at destruction.
    void Release() noexcept;

private:
    explicit LockFile(std::filesystem::path path);

    std::filesystem::path path_;
    bool released_ = false;
};

/// Write `contents` to a temporary file beside `path`, fsync it, then
/// rename() it over `path`. Readers see the old file or the new one.
[[nodiscard]] Result<void, Error> AtomicWriteFile(const std::filesystem::path& path,
                                                  const std::string& contents);

/// Whole-file read.
[[nodiscard]] Result<std::string, Error> ReadFileContents(const std::filesystem::path& path);

/// The lock guarding `state_path`: the same path with ".lock" appended.
[[nodiscard]] std::filesystem::path StateLockPath(const std::filesystem::path& state_path);

/// Take the lock beside `path`, AtomicWriteFile, release. The lock is gone
/// when this returns, whether or not the write succeeded.
[[nodiscard]] Result<void, Error> LockedWriteFile(const Context& ctx,
                                                  const std::filesystem::path& path,
                                                  const std::string& contents);

/// Pretty-printed JSON. Invalid UTF-8 inside strings becomes U+FFFD instead
/// of throwing.
[[nodiscard]] std::string SerializeJson(const nlohmann::json& doc);

// ---------------------------------------------------------------------------
// StateStore: loads and persists the state document.
//
// Load never fails on a corrupt document: it logs, starts over with an empty
// document, persists it, and raises LastLoadRecoveredFromCorruption().
//
// Writers that read first go through Mutate, which holds the lock from the
// read to the rename so concurrent read-modify-write cycles serialize.
// ---------------------------------------------------------------------------
class StateStore {
public:
    using Mutation = std::function<Result<void, Error>(StateFile&)>;

    explicit StateStore(const Context& ctx);

    [[nodiscard]] Result<StateFile, Error> Load();

    /// Stamps metadata.last_updated and writes the document under the lock.
    [[nodiscard]] Result<void, Error> Save(StateFile& state);

    /// Lock, read the current document, apply `change`, write, unlock. A
    /// failing change leaves the file as it was. Returns the written document.
    [[nodiscard]] Result<StateFile, Error> Mutate(const Mutation& change);

    [[nodiscard]] Result<std::optional<DeploymentState>, Error> GetRepositoryState(
        const std::string& repository_id);
    [[nodiscard]] Result<int, Error> GetTotalDeployedFiles();
    [[nodiscard]] Result<std::string, Error> GetLastUpdated();

    /// Replace the document with an empty one.
    [[nodiscard]] Result<void, Error> ResetAll();

    [[nodiscard]] bool LastLoadRecoveredFromCorruption() const noexcept {
        return recovered_from_corruption_;
    }
    [[nodiscard]] const std::optional<Error>& LastCorruptionError() const noexcept {
        return corruption_error_;
    }

    [[nodiscard]] std::filesystem::path StatePath() const;
    [[nodiscard]] std::filesystem::path LockPath() const;

private:
    // Load without writing. `needs_write` is raised when the document was
    // missing or corrupt and the returned empty one must be persisted.
    [[nodiscard]] Result<StateFile, Error> ReadDocument(bool& needs_write);
    [[nodiscard]] Result<void, Error> WriteHeld(StateFile& state);

    const Context& ctx_;
    bool recovered_from_corruption_ = false;
    std::optional<Error> corruption_error_;
};

} // namespace ccpm
