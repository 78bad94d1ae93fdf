#include <ccpm/state/state_store.hpp>

#include <ccpm/core/timestamp.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ccpm {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "state";

// Closes a raw descriptor on scope exit.
class FdCloser {
public:
    explicit FdCloser(int fd) : fd_(fd) {}
    ~FdCloser() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

bool WriteAll(int fd, const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        auto n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// A string version, or an object version tagged "v1", is the legacy layout.
bool RequiresMigration(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return false;
    }
    auto version = doc.find("version");
    if (version == doc.end()) {
        return false;
    }
    if (version->is_string()) {
        return true;
    }
    if (!version->is_object()) {
        return false;
    }
    auto format = version->find("format");
    return format != version->end() && format->is_string() &&
           format->get<std::string>() == "v1";
}

} // anonymous namespace

// ===========================================================================
// LockFile
// ===========================================================================
LockFile::LockFile(fs::path path) : path_(std::move(path)) {}

Result<LockFile, Error> LockFile::Acquire(const fs::path& lock_path,
                                          int max_attempts,
                                          std::chrono::milliseconds retry_delay) {
    std::error_code ec;
    if (lock_path.has_parent_path()) {
        fs::create_directories(lock_path.parent_path(), ec);
        if (ec) {
            return Result<LockFile, Error>::Err(
                Error::FromErrorCode("AcquireLock", lock_path.parent_path().string(), ec));
        }
    }

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        int fd = ::open(lock_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd >= 0) {
            FdCloser closer(fd);
            const std::string owner = "{\"pid\":" + std::to_string(::getpid()) +
                                      ",\"timestamp\":\"" + Iso8601Now() + "\"}";
            if (!WriteAll(fd, owner)) {
                auto err = Error::FromErrno("AcquireLock", lock_path.string());
                ::unlink(lock_path.c_str());
                return Result<LockFile, Error>::Err(std::move(err));
            }
            return Result<LockFile, Error>::Ok(LockFile(lock_path));
        }
        if (errno != EEXIST) {
            return Result<LockFile, Error>::Err(Error::FromErrno("AcquireLock", lock_path.string()));
        }
        if (attempt + 1 < max_attempts) {
            std::this_thread::sleep_for(retry_delay);
        }
    }

    return Result<LockFile, Error>::Err(Error{
        "AcquireLock", lock_path.string(), "Unable to acquire lock for state file",
        "lock held after " + std::to_string(max_attempts) + " attempts",
        ErrorCategory::LockConflict});
}

LockFile::~LockFile() {
    Release();
}

LockFile::LockFile(LockFile&& other) noexcept
    : path_(std::move(other.path_)), released_(other.released_) {
    other.released_ = true;
}

LockFile& LockFile::operator=(LockFile&& other) noexcept {
    if (this != &other) {
        Release();
        path_ = std::move(other.path_);
        released_ = other.released_;
        other.released_ = true;
    }
    return *this;
}

void LockFile::Release() noexcept {
    if (released_) {
        return;
    }
    released_ = true;
    ::unlink(path_.c_str());
}

// ===========================================================================
// File helpers
// ===========================================================================
Result<void, Error> AtomicWriteFile(const fs::path& path, const std::string& contents) {
    const auto dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void, Error>::Err(Error::FromErrorCode("AtomicWrite", dir.string(), ec));
    }

    std::string tmpl = (dir / (path.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result<void, Error>::Err(Error::FromErrno("AtomicWrite", tmpl));
    }
    const std::string tmp_path(buf.data());
    FdCloser closer(fd);

    if (!WriteAll(fd, contents) || ::fsync(fd) != 0) {
        auto err = Error::FromErrno("AtomicWrite", tmp_path);
        ::unlink(tmp_path.c_str());
        return Result<void, Error>::Err(std::move(err));
    }
    if (::close(closer.Release()) != 0) {
        auto err = Error::FromErrno("AtomicWrite", tmp_path);
        ::unlink(tmp_path.c_str());
        return Result<void, Error>::Err(std::move(err));
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        auto err = Error::FromErrno("AtomicWrite", path.string());
        ::unlink(tmp_path.c_str());
        return Result<void, Error>::Err(std::move(err));
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ReadFileContents(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<std::string, Error>::Err(Error{
                "ReadFile", path.string(), "File does not exist", std::nullopt,
                ErrorCategory::NotFound});
        }
        return Result<std::string, Error>::Err(Error::FromErrno("ReadFile", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string, Error>::Ok(ss.str());
}

fs::path StateLockPath(const fs::path& state_path) {
    auto p = state_path;
    p += ".lock";
    return p;
}

Result<void, Error> LockedWriteFile(const Context& ctx, const fs::path& path,
                                    const std::string& contents) {
    auto lock = LockFile::Acquire(StateLockPath(path), ctx.config.state.lock_retries,
                                  std::chrono::milliseconds(ctx.config.state.lock_retry_delay_ms));
    if (lock.IsErr()) {
        ctx.logger.Error(kComponent, lock.Error().ToString());
        return Result<void, Error>::Err(std::move(lock).Error());
    }
    return AtomicWriteFile(path, contents);
}

std::string SerializeJson(const nlohmann::json& doc) {
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ===========================================================================
// StateStore
// ===========================================================================
StateStore::StateStore(const Context& ctx) : ctx_(ctx) {}

fs::path StateStore::StatePath() const {
    return ctx_.StateFile();
}

fs::path StateStore::LockPath() const {
    return StateLockPath(StatePath());
}

Result<StateFile, Error> StateStore::Load() {
    bool needs_write = false;
    auto state = ReadDocument(needs_write);
    if (state.IsErr() || !needs_write) {
        return state;
    }
    auto saved = Save(state.Value());
    if (saved.IsErr()) {
        return Result<StateFile, Error>::Err(std::move(saved).Error());
    }
    return state;
}

Result<StateFile, Error> StateStore::ReadDocument(bool& needs_write) {
    recovered_from_corruption_ = false;
    corruption_error_.reset();
    needs_write = false;

    const auto path = StatePath();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        ctx_.logger.Info(kComponent, "No state file at " + path.string() + ", initializing");
        needs_write = true;
        return Result<StateFile, Error>::Ok(StateFile::Empty());
    }

    auto contents = ReadFileContents(path);
    if (contents.IsErr()) {
        return Result<StateFile, Error>::Err(std::move(contents).Error());
    }

    nlohmann::json doc = nlohmann::json::parse(contents.Value(), nullptr, /*allow_exceptions=*/false);
    std::optional<Error> failure;
    if (doc.is_discarded()) {
        failure = Error{"LoadState", path.string(), "State file is not valid JSON",
                        std::nullopt, ErrorCategory::StateCorruption};
    } else if (RequiresMigration(doc)) {
        return Result<StateFile, Error>::Err(Error{
            "LoadState", path.string(), "State file uses a legacy schema and must be migrated",
            std::nullopt, ErrorCategory::VersionMismatch});
    } else {
        auto decoded = StateFileFromJson(doc);
        if (decoded.IsOk()) {
            return decoded;
        }
        if (decoded.Error().category == ErrorCategory::VersionMismatch) {
            auto err = std::move(decoded).Error();
            err.path = path.string();
            return Result<StateFile, Error>::Err(std::move(err));
        }
        failure = std::move(decoded).Error();
        failure->path = path.string();
    }

    auto preserved = path;
    preserved += ".corrupt." + FileSafeTimestamp(std::chrono::system_clock::now());
    auto kept = AtomicWriteFile(preserved, contents.Value());
    if (kept.IsErr()) {
        ctx_.logger.Warn(kComponent, "Could not preserve corrupt state: " + kept.Error().ToString());
    } else {
        failure->detail = "original preserved at " + preserved.string();
    }

    ctx_.logger.Error(kComponent, "State file corrupted, reinitializing: " + failure->ToString());
    recovered_from_corruption_ = true;
    corruption_error_ = failure;
    needs_write = true;
    return Result<StateFile, Error>::Ok(StateFile::Empty());
}

Result<void, Error> StateStore::Save(StateFile& state) {
    state.metadata.last_updated = Iso8601Now();
    const auto contents = SerializeJson(ToJson(state));

    auto written = LockedWriteFile(ctx_, StatePath(), contents);
    if (written.IsErr()) {
        ctx_.logger.Error(kComponent, "Failed to save state: " + written.Error().ToString());
        return written;
    }
    ctx_.logger.Debug(kComponent, "State saved to " + StatePath().string());
    return Result<void, Error>::Ok();
}

Result<void, Error> StateStore::WriteHeld(StateFile& state) {
    state.metadata.last_updated = Iso8601Now();
    auto written = AtomicWriteFile(StatePath(), SerializeJson(ToJson(state)));
    if (written.IsErr()) {
        ctx_.logger.Error(kComponent, "Failed to save state: " + written.Error().ToString());
        return written;
    }
    ctx_.logger.Debug(kComponent, "State saved to " + StatePath().string());
    return Result<void, Error>::Ok();
}

Result<StateFile, Error> StateStore::Mutate(const Mutation& change) {
    auto lock = LockFile::Acquire(LockPath(), ctx_.config.state.lock_retries,
                                  std::chrono::milliseconds(ctx_.config.state.lock_retry_delay_ms));
    if (lock.IsErr()) {
        ctx_.logger.Error(kComponent, lock.Error().ToString());
        return Result<StateFile, Error>::Err(std::move(lock).Error());
    }

    bool needs_write = false;
    auto current = ReadDocument(needs_write);
    if (current.IsErr()) {
        return current;
    }
    auto state = std::move(current).Value();

    auto changed = change(state);
    if (changed.IsErr()) {
        if (needs_write) {
            // The on-disk document is missing or corrupt; persist the empty one anyway.
            auto empty = StateFile::Empty();
            auto written = WriteHeld(empty);
            if (written.IsErr()) {
                ctx_.logger.Warn(kComponent, "Could not initialize state: " +
                                 written.Error().ToString());
            }
        }
        return Result<StateFile, Error>::Err(std::move(changed).Error());
    }

    auto written = WriteHeld(state);
    if (written.IsErr()) {
        return Result<StateFile, Error>::Err(std::move(written).Error());
    }
    return Result<StateFile, Error>::Ok(std::move(state));
}

Result<std::optional<DeploymentState>, Error> StateStore::GetRepositoryState(
    const std::string& repository_id) {
    using R = Result<std::optional<DeploymentState>, Error>;
    auto loaded = Load();
    if (loaded.IsErr()) {
        return R::Err(std::move(loaded).Error());
    }
    const auto& states = loaded.Value().deployment_states;
    auto it = states.find(repository_id);
    if (it == states.end()) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(it->second);
}

Result<int, Error> StateStore::GetTotalDeployedFiles() {
    return Load().Map([](const StateFile& state) {
        int total = 0;
        for (const auto& [id, s] : state.deployment_states) {
            total += static_cast<int>(s.deployed_files.size());
        }
        return total;
    });
}

Result<std::string, Error> StateStore::GetLastUpdated() {
    return Load().Map([](const StateFile& state) { return state.metadata.last_updated; });
}

Result<void, Error> StateStore::ResetAll() {
    ctx_.logger.Warn(kComponent, "Resetting state file " + StatePath().string());
    auto state = StateFile::Empty();
    return Save(state);
}

} // namespace ccpm
