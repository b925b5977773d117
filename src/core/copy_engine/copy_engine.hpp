#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>
#include "../copy_task.hpp"
#include "../diagnostics.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace pcopy::core {

struct CopyPlan {
    std::filesystem::path destination;      // итоговый путь назначения
    std::vector<CopyTask> directories;      // создаются последовательно до старта пула
    std::vector<CopyTask> transfers;        // файлы и ссылки для воркеров
    std::vector<infra::Error> enumeration_errors;

    [[nodiscard]] auto task_count() const -> std::size_t {
        return directories.size() + transfers.size();
    }
};

struct CopyReport {
    std::uint64_t attempted = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t abandoned = 0;
    std::uint64_t bytes_copied = 0;
    std::size_t workers = 0;
    bool interrupted = false;
    std::chrono::steady_clock::duration elapsed{};
    std::vector<TaskFailure> failures;

    [[nodiscard]] auto failed() const -> std::uint64_t { return failures.size(); }
    [[nodiscard]] auto ok() const -> bool { return failures.empty() && !interrupted; }
};

class CopyEngine {
public:
    // Тик главного потока: перерисовка; false → graceful drain
    using TickFn = std::function<bool()>;

    CopyEngine(const infra::Config& config,
               infra::ProgressAggregator& progress,
               DiagnosticsReporter& reporter);

    /// Копирует файл, ссылку или дерево каталогов.
    /// Ошибка возвращается только если SOURCE или DESTINATION не разрешаются
    /// (включая невозможность создать корневой каталог назначения) либо если
    /// остановка запрошена ещё во время обхода дерева.
    /// Ошибки отдельных элементов попадают в CopyReport::failures.
    [[nodiscard]] auto run(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           const TickFn& on_tick = {})
        -> infra::Result<CopyReport>;

    // Обход дерева прерывается, если on_tick вернул false
    [[nodiscard]] auto plan(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            const TickFn& on_tick = {})
        -> infra::Result<CopyPlan>;

private:
    // Вызывает тик не чаще раза в interval; первый вызов срабатывает сразу
    class Ticker {
    public:
        Ticker(const TickFn& fn, std::chrono::milliseconds interval)
            : fn_(fn), interval_(interval) {}

        // false, если тик запросил остановку
        bool poll() {
            if (!fn_) {
                return true;
            }
            const auto now = std::chrono::steady_clock::now();
            if (fired_ && now - last_ < interval_) {
                return true;
            }
            fired_ = true;
            last_ = now;
            return fn_();
        }

    private:
        const TickFn& fn_;
        const std::chrono::milliseconds interval_;
        std::chrono::steady_clock::time_point last_{};
        bool fired_ = false;
    };

    [[nodiscard]] auto plan_(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             Ticker& ticker)
        -> infra::Result<CopyPlan>;
    [[nodiscard]] auto resolve_file_destination_(const std::filesystem::path& source,
                                                 const std::filesystem::path& destination) const
        -> std::filesystem::path;
    [[nodiscard]] auto check_tree_destination_(const std::filesystem::path& source,
                                               const std::filesystem::path& destination) const
        -> infra::VoidResult;

    const infra::Config& config_;
    infra::ProgressAggregator& progress_;
    DiagnosticsReporter& reporter_;
};

} // namespace pcopy::core
