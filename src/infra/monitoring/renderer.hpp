#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include "monitoring.hpp"

namespace pcopy::infra {

/// "12.3 MB" — двоичные единицы, один знак после запятой
[[nodiscard]] auto format_bytes(double bytes) -> std::string;

/// "01:02:03" или "02:03"; "--:--" для неизвестного значения
[[nodiscard]] auto format_duration(double seconds) -> std::string;

/// Многострочный вывод снимка ProgressAggregator с перерисовкой на месте.
/// Вызывается только из главного потока по таймеру.
class ProgressRenderer {
public:
    explicit ProgressRenderer(std::size_t path_width, bool enabled = true, std::FILE* out = stdout);
    ~ProgressRenderer();

    ProgressRenderer(const ProgressRenderer&) = delete;
    ProgressRenderer& operator=(const ProgressRenderer&) = delete;

    void draw(const ProgressAggregator::Snapshot& snap);

    // Стирает последний кадр
    void finish();

private:
    [[nodiscard]] auto render_header_(const ProgressAggregator::Snapshot& snap) const -> std::string;
    [[nodiscard]] auto render_entry_(const ProgressAggregator::ActiveEntry& entry) -> std::string;

    const std::size_t path_width_;
    const bool enabled_;
    std::FILE* out_;
    std::size_t lines_drawn_ = 0;
    std::size_t tick_ = 0;
};

} // namespace pcopy::infra
