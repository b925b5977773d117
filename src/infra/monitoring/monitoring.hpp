#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pcopy::infra {

/// Обрезает путь до max_width символов (кодовых точек UTF-8), заменяя начало на "..."
[[nodiscard]] auto truncate_display_path(std::string_view path, std::size_t max_width) -> std::string;

/// Реестр активных файлов и общих счётчиков.
/// Запись создаётся в begin() (InProgress) и удаляется в complete()/fail(),
/// так что snapshot() видит только копируемые прямо сейчас файлы.
/// Блокировка держится только на время обновления метаданных.
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;
    using EntryId = std::uint64_t;

    static constexpr std::chrono::milliseconds kRateWindow{1000};
    static constexpr std::chrono::milliseconds kSampleSpacing{50};

    struct ActiveEntry {
        EntryId id = 0;
        std::string display_path;
        std::uint64_t bytes_done = 0;
        std::uint64_t bytes_total = 0;
        double rate = 0.0; // bytes/sec по скользящему окну
        Clock::time_point start_time{};
        Clock::time_point last_update_time{};
    };

    struct Counters {
        std::uint64_t total_files = 0;
        std::uint64_t completed_files = 0;
        std::uint64_t failed_files = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t completed_bytes = 0;
    };

    struct Snapshot {
        std::vector<ActiveEntry> active;
        Counters counters;
        Clock::duration elapsed{};
    };

    explicit ProgressAggregator(std::size_t max_path_width = 30);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Увеличивает ожидаемые итоги (вызывается при планировании задач)
    void add_total(std::uint64_t files, std::uint64_t bytes);

    // Pending → InProgress
    [[nodiscard]] auto begin(std::string_view path, std::uint64_t bytes_total) -> EntryId;
    void advance(EntryId id, std::uint64_t bytes);
    // InProgress → Completed / Failed; запись удаляется
    void complete(EntryId id);
    void fail(EntryId id);

    // Для задач без записи (symlink, directory): сразу Completed / Failed
    void record_completed(std::uint64_t bytes = 0);
    void record_failed();

    [[nodiscard]] auto snapshot() const -> Snapshot;
    [[nodiscard]] auto counters() const -> Counters;
    [[nodiscard]] auto active_count() const -> std::size_t;
    [[nodiscard]] auto elapsed() const -> Clock::duration;

private:
    struct Entry {
        std::string display_path;
        std::uint64_t bytes_done = 0;
        std::uint64_t bytes_total = 0;
        Clock::time_point start_time{};
        Clock::time_point last_update_time{};
        // (время, bytes_done) за последние kRateWindow
        std::deque<std::pair<Clock::time_point, std::uint64_t>> samples;
    };

    // Скорость за последние kRateWindow до now; 0, если файл не пишется
    [[nodiscard]] static auto rate_of(const Entry& entry, Clock::time_point now) -> double;

    const std::size_t max_path_width_;
    const Clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::map<EntryId, Entry> entries_;
    EntryId next_id_ = 1;

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> completed_files_{0};
    std::atomic<std::uint64_t> failed_files_{0};
    std::atomic<std::uint64_t> completed_bytes_{0};
};

} // namespace pcopy::infra
