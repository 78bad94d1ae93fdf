#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace ccpm {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T& Value() & {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes, recovery and JSON output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Io,
    PermissionDenied,
    NotFound,
    DiskFull,
    LockConflict,
    StateCorruption,
    Validation,
    VersionMismatch,
    Migration,
    Timeout,
    Network,
    Authentication,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type shared by the engine, store and migrator.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string path;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;

    /// Build an Error from an OS error code, picking the category from errno.
    static Error FromErrorCode(const std::string& operation,
                               const std::string& path,
                               const std::error_code& ec);

    /// Same as FromErrorCode, reading the current errno.
    static Error FromErrno(const std::string& operation,
                           const std::string& path);

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Io:               return 1;
            case ErrorCategory::PermissionDenied: return 2;
            case ErrorCategory::NotFound:         return 3;
            case ErrorCategory::DiskFull:         return 4;
            case ErrorCategory::LockConflict:     return 5;
            case ErrorCategory::StateCorruption:  return 6;
            case ErrorCategory::Validation:       return 7;
            case ErrorCategory::VersionMismatch:  return 8;
            case ErrorCategory::Migration:        return 9;
            case ErrorCategory::Timeout:          return 10;
            case ErrorCategory::Network:          return 11;
            case ErrorCategory::Authentication:   return 12;
            case ErrorCategory::Internal:         return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Io:               return "io";
            case ErrorCategory::PermissionDenied: return "permission_denied";
            case ErrorCategory::NotFound:         return "not_found";
            case ErrorCategory::DiskFull:         return "disk_full";
            case ErrorCategory::LockConflict:     return "lock_conflict";
            case ErrorCategory::StateCorruption:  return "state_corruption";
            case ErrorCategory::Validation:       return "validation";
            case ErrorCategory::VersionMismatch:  return "version_mismatch";
            case ErrorCategory::Migration:        return "migration";
            case ErrorCategory::Timeout:          return "timeout";
            case ErrorCategory::Network:          return "network";
            case ErrorCategory::Authentication:   return "authentication";
            case ErrorCategory::Internal:         return "internal";
        }
        return "internal";
    }

    /// Lock contention and transient failures may succeed when run again.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return category == ErrorCategory::LockConflict ||
               category == ErrorCategory::Timeout ||
               category == ErrorCategory::Network;
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!path.empty()) {
            oss << " [" << path << "]";
        }
        oss << ": " << message;
        if (detail.has_value() && !detail->empty()) {
            oss << " (" << *detail << ")";
        }
        return oss.str();
    }

    /// JSON rendering for --json output; defined in result.cpp.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               path == other.path &&
               message == other.message &&
               detail == other.detail &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace ccpm
