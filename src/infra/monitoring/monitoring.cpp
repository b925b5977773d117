#include "monitoring.hpp"
#include <algorithm>

namespace pcopy::infra {

namespace {

// Продолжающий байт UTF-8: 10xxxxxx
bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Число символов (кодовых точек) в строке UTF-8
auto utf8_length(std::string_view s) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
        [](char c) { return !is_continuation(c); }));
}

// Последние n символов строки UTF-8
auto utf8_tail(std::string_view s, std::size_t n) -> std::string_view {
    std::size_t pos = s.size();
    while (pos > 0 && n > 0) {
        --pos;
        if (!is_continuation(s[pos])) {
            --n;
        }
    }
    return s.substr(pos);
}

} // namespace

auto truncate_display_path(std::string_view path, std::size_t max_width) -> std::string {
    if (utf8_length(path) <= max_width) {
        return std::string(path);
    }
    constexpr std::string_view ellipsis = "...";
    if (max_width <= ellipsis.size()) {
        return std::string(utf8_tail(path, max_width));
    }
    return std::string(ellipsis) + std::string(utf8_tail(path, max_width - ellipsis.size()));
}

ProgressAggregator::ProgressAggregator(std::size_t max_path_width)
    : max_path_width_(max_path_width)
    , start_time_(Clock::now())
{}

void ProgressAggregator::add_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_.fetch_add(files, std::memory_order_relaxed);
    total_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

auto ProgressAggregator::begin(std::string_view path, std::uint64_t bytes_total) -> EntryId {
    auto display = truncate_display_path(path, max_path_width_);
    const auto now = Clock::now();

    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    Entry entry{
        .display_path = std::move(display),
        .bytes_done = 0,
        .bytes_total = bytes_total,
        .start_time = now,
        .last_update_time = now,
        .samples = {}
    };
    entry.samples.emplace_back(now, 0);
    entries_.emplace(id, std::move(entry));
    return id;
}

void ProgressAggregator::advance(EntryId id, std::uint64_t bytes) {
    completed_bytes_.fetch_add(bytes, std::memory_order_relaxed);

    const auto now = Clock::now();
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    auto& entry = it->second;
    entry.bytes_done += bytes;
    entry.last_update_time = now;
    // Отсчёты прореживаются до одного на kSampleSpacing
    const auto n = entry.samples.size();
    if (n >= 2 && now - entry.samples[n - 2].first < kSampleSpacing) {
        entry.samples.back() = {now, entry.bytes_done};
    } else {
        entry.samples.emplace_back(now, entry.bytes_done);
    }
    // Самый старый отсчёт внутри окна остаётся опорной точкой
    while (entry.samples.size() > 2 && now - entry.samples[1].first > kRateWindow) {
        entry.samples.pop_front();
    }
}

void ProgressAggregator::complete(EntryId id) {
    {
        std::lock_guard lock(mutex_);
        entries_.erase(id);
    }
    completed_files_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressAggregator::fail(EntryId id) {
    {
        std::lock_guard lock(mutex_);
        entries_.erase(id);
    }
    failed_files_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressAggregator::record_completed(std::uint64_t bytes) {
    completed_files_.fetch_add(1, std::memory_order_relaxed);
    completed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressAggregator::record_failed() {
    failed_files_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressAggregator::rate_of(const Entry& entry, Clock::time_point now) -> double {
    if (entry.samples.size() < 2) {
        return 0.0;
    }
    const auto& [t_last, b_last] = entry.samples.back();
    // Нет записей за целое окно: файл стоит
    if (now - t_last >= kRateWindow) {
        return 0.0;
    }
    // Опорная точка: последний отсчёт не позже начала окна, иначе самый старый
    auto ref = entry.samples.front();
    for (const auto& sample : entry.samples) {
        if (now - sample.first < kRateWindow) {
            break;
        }
        ref = sample;
    }
    const auto seconds = std::chrono::duration<double>(now - ref.first).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(b_last - ref.second) / seconds;
}

auto ProgressAggregator::snapshot() const -> Snapshot {
    Snapshot snap;
    const auto now = Clock::now();
    {
        std::lock_guard lock(mutex_);
        snap.active.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            snap.active.push_back(ActiveEntry{
                .id = id,
                .display_path = entry.display_path,
                .bytes_done = entry.bytes_done,
                .bytes_total = entry.bytes_total,
                .rate = rate_of(entry, now),
                .start_time = entry.start_time,
                .last_update_time = entry.last_update_time
            });
        }
    }
    snap.counters = counters();
    snap.elapsed = elapsed();
    return snap;
}

auto ProgressAggregator::counters() const -> Counters {
    return Counters{
        .total_files = total_files_.load(std::memory_order_relaxed),
        .completed_files = completed_files_.load(std::memory_order_relaxed),
        .failed_files = failed_files_.load(std::memory_order_relaxed),
        .total_bytes = total_bytes_.load(std::memory_order_relaxed),
        .completed_bytes = completed_bytes_.load(std::memory_order_relaxed)
    };
}

auto ProgressAggregator::active_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

auto ProgressAggregator::elapsed() const -> Clock::duration {
    return Clock::now() - start_time_;
}

} // namespace pcopy::infra
