#include <ccpm/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>

namespace ccpm {

namespace {

ErrorCategory CategoryFromErrno(int value) {
    switch (value) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCategory::PermissionDenied;
        case ENOENT:
        case ENOTDIR:
            return ErrorCategory::NotFound;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ErrorCategory::DiskFull;
        case ETIMEDOUT:
            return ErrorCategory::Timeout;
        case EEXIST:
            return ErrorCategory::LockConflict;
        default:
            return ErrorCategory::Io;
    }
}

} // anonymous namespace

Error Error::FromErrorCode(const std::string& operation,
                           const std::string& path,
                           const std::error_code& ec) {
    ErrorCategory category = ErrorCategory::Io;
    if (ec.category() == std::generic_category() ||
        ec.category() == std::system_category()) {
        category = CategoryFromErrno(ec.value());
    }
    return Error{operation, path, ec.message(), std::nullopt, category};
}

Error Error::FromErrno(const std::string& operation, const std::string& path) {
    return FromErrorCode(operation, path,
                         std::error_code(errno, std::generic_category()));
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!path.empty()) {
        j["path"] = path;
    }
    j["message"] = message;
    if (detail.has_value() && !detail->empty()) {
        j["detail"] = *detail;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", j}}.dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
}

} // namespace ccpm
