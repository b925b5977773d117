#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace pcopy::core {

enum class EntryKind {
    File,
    Symlink,
    Directory,
};

[[nodiscard]] constexpr auto to_string(EntryKind kind) -> std::string_view {
    switch (kind) {
        case EntryKind::File:      return "file";
        case EntryKind::Symlink:   return "symlink";
        case EntryKind::Directory: return "directory";
    }
    return "unknown";
}

// Одна единица работы; неизменяема после создания
struct CopyTask {
    std::filesystem::path source;
    std::filesystem::path destination;
    EntryKind kind = EntryKind::File;
    std::uint64_t size_bytes = 0; // 0 для symlink/directory
};

struct TaskFailure {
    std::filesystem::path path;
    infra::ErrorCode error_kind;
    std::string message;
};

[[nodiscard]] inline auto to_failure(const infra::Error& err) -> TaskFailure {
    return TaskFailure{
        .path = err.path,
        .error_kind = err.code,
        .message = err.message
    };
}

} // namespace pcopy::core
