#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "work_distributor.hpp"
#include "../copy_task.hpp"
#include "../diagnostics.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace pcopy::core {

struct PoolOptions {
    std::size_t max_workers = 10;
    std::size_t buffer_size = 64 * 1024;
    std::chrono::milliseconds tick_interval{100};
};

struct PoolResult {
    std::size_t workers = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t abandoned = 0;
    bool interrupted = false;
    std::vector<TaskFailure> failures;
};

/// Ограниченный пул воркеров: min(max_workers, task_count) потоков,
/// каждый берёт задачи из WorkDistributor до исчерпания.
/// Ошибка задачи не останавливает воркер: она уходит в DiagnosticsReporter
/// и в итоговый PoolResult.
class WorkerPool {
public:
    // Вызывается главным потоком раз в tick_interval; false → остановка
    using TickFn = std::function<bool()>;

    WorkerPool(WorkDistributor& distributor,
               infra::ProgressAggregator& progress,
               DiagnosticsReporter& reporter,
               PoolOptions options);

    // Блокирует до выхода всех воркеров
    [[nodiscard]] auto run(std::size_t task_count, const TickFn& on_tick = {}) -> PoolResult;

    [[nodiscard]] static auto worker_count(std::size_t max_workers, std::size_t task_count) -> std::size_t;

private:
    struct WorkerOutcome {
        std::uint64_t succeeded = 0;
        std::uint64_t bytes_copied = 0;
        bool interrupted = false;
        std::vector<TaskFailure> failures;
    };

    void work_(std::stop_token st, WorkerOutcome& outcome);

    WorkDistributor& distributor_;
    infra::ProgressAggregator& progress_;
    DiagnosticsReporter& reporter_;
    PoolOptions options_;
};

} // namespace pcopy::core
