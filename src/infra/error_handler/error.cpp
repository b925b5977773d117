#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>

namespace pcopy::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::PermissionDenied:    return "PermissionDenied";
        case ErrorCode::DestinationConflict: return "DestinationConflict";
        case ErrorCode::IOFailure:           return "IOFailure";
        case ErrorCode::EnumerationError:    return "EnumerationError";
        case ErrorCode::UnsupportedType:     return "UnsupportedType";
        case ErrorCode::InvalidPath:         return "InvalidPath";
        case ErrorCode::Interrupted:         return "Interrupted";
    }
    return "Unknown";
}

int Error::to_exit_code() const {
    if (code == ErrorCode::Interrupted) return 130; // SIGINT
    return EXIT_FAILURE;
}

ErrorCode code_from_errno(int err) {
    switch (err) {
        case ENOENT:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        case EEXIST:
        case EISDIR:
        case ENOTDIR:
            return ErrorCode::DestinationConflict;
        default:
            return ErrorCode::IOFailure;
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::filesystem::path& path,
                 const std::source_location& loc) {
    return Error{code, message, path, 0, loc};
}

Error from_errno(int err, std::string_view what,
                 const std::filesystem::path& path,
                 const std::source_location& loc) {
    return Error{code_from_errno(err),
                 fmt::format("{}: {}", what, std::generic_category().message(err)),
                 path, err, loc};
}

Error from_error_code(const std::error_code& ec, std::string_view what,
                      const std::filesystem::path& path,
                      const std::source_location& loc) {
    const int err = ec.category() == std::generic_category() ||
                    ec.category() == std::system_category() ? ec.value() : EIO;
    return Error{code_from_errno(err),
                 fmt::format("{}: {}", what, ec.message()),
                 path, err, loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {} ({})",
        err.file, err.line, err.function,
        err.code, err.message, err.path.string()
    );
    return std::move(err);
}

} // namespace pcopy::infra
