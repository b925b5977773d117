#pragma once

#include <cstddef>
#include <cstdint>
#include <stop_token>
#include "../copy_task.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace pcopy::core {

/// Выполняет одну задачу и сообщает о переходах состояния в ProgressAggregator:
///   File      — запись создаётся на старте, растёт на каждый буфер, удаляется в конце;
///   Symlink   — пересоздание ссылки с той же строкой цели;
///   Directory — идемпотентное создание каталога.
/// Возвращает число скопированных байт (0 для symlink/directory).
[[nodiscard]] auto execute_task(const CopyTask& task,
                                infra::ProgressAggregator& progress,
                                std::size_t buffer_size,
                                std::stop_token st = {})
    -> infra::Result<std::uint64_t>;

} // namespace pcopy::core
