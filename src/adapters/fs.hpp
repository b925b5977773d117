#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include "../core/copy_task.hpp"
#include "../infra/error_handler/error.hpp"

namespace pcopy::adapters::fs {

struct EntryInfo {
    core::EntryKind kind;
    std::uint64_t size = 0;                  // только для File
    std::filesystem::path link_target;       // только для Symlink, без разрешения
};

/// Тип и размер записи без перехода по символическим ссылкам.
/// NotFound, PermissionDenied или UnsupportedType (fifo, socket, device).
[[nodiscard]] auto classify(const std::filesystem::path& path)
    -> infra::Result<EntryInfo>;

// Вызывается после каждой записи буфера с числом записанных байт
using ProgressFn = std::function<void(std::uint64_t)>;

/// Побайтное копирование через буфер фиксированного размера.
/// Назначение создаётся или усекается. Возвращает число скопированных байт.
/// При запросе остановки дописывает текущий буфер и возвращает Interrupted.
[[nodiscard]] auto copy_regular_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size,
    const ProgressFn& on_chunk = {},
    std::stop_token st = {}
) -> infra::Result<std::uint64_t>;

/// Создаёт ссылку dst с той же строкой цели, что у src. Цель не проверяется.
/// Уже существующая ссылка с той же целью считается успехом.
[[nodiscard]] auto copy_symlink(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

/// Идемпотентно создаёт каталог; DestinationConflict, если на месте dst не каталог.
[[nodiscard]] auto create_directory(const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace pcopy::adapters::fs
