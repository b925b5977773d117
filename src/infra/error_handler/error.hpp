#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace pcopy::infra {

enum class ErrorCode {
    // Ошибки отдельной задачи (копирование продолжается)
    NotFound,
    PermissionDenied,
    DestinationConflict,   // не-каталог на месте ожидаемого каталога и т.п.
    IOFailure,             // read/write, disk full, broken pipe
    EnumerationError,      // поддерево не читается при обходе
    UnsupportedType,       // fifo, socket, device

    // Аргументы верхнего уровня
    InvalidPath,

    Interrupted,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::filesystem::path path;
    int sys_errno = 0;
    bool fatal = false;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          std::filesystem::path p = {},
          int err = 0,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , path(std::move(p))
        , sys_errno(err)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool { return fatal; }
    [[nodiscard]] auto to_exit_code() const -> int;

    // Помечает ошибку как фатальную (SOURCE/DESTINATION не разрешаются)
    [[nodiscard]] auto as_fatal() && -> Error {
        fatal = true;
        return std::move(*this);
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::filesystem::path& path = {},
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Ошибка из errno: ENOENT → NotFound, EACCES/EPERM → PermissionDenied,
/// EEXIST/EISDIR/ENOTDIR → DestinationConflict, остальное → IOFailure.
[[nodiscard]] auto from_errno(
    int err,
    std::string_view what,
    const std::filesystem::path& path,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto from_error_code(
    const std::error_code& ec,
    std::string_view what,
    const std::filesystem::path& path,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto code_from_errno(int err) -> ErrorCode;

[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace pcopy::infra

template<>
struct fmt::formatter<pcopy::infra::ErrorCode> : fmt::formatter<std::string_view> {
    auto format(pcopy::infra::ErrorCode code, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(pcopy::infra::to_string(code), ctx);
    }
};
