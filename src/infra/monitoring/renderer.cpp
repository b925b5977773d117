#include "renderer.hpp"
#include <fmt/core.h>
#include <fmt/color.h>
#include <array>
#include <cmath>

namespace pcopy::infra {

namespace {

constexpr int kBarWidth = 30;
constexpr std::array<const char*, 10> kSpinner{"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

auto make_bar(double fraction) -> std::string {
    if (!std::isfinite(fraction) || fraction < 0.0) fraction = 0.0;
    if (fraction > 1.0) fraction = 1.0;
    const int filled = static_cast<int>(fraction * kBarWidth);
    std::string bar;
    for (int i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return bar;
}

} // namespace

auto format_bytes(double bytes) -> std::string {
    static constexpr std::array units{"B", "KB", "MB", "GB", "TB", "PB"};
    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit < units.size() - 1) {
        bytes /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", bytes, units[unit]);
}

auto format_duration(double seconds) -> std::string {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "--:--";
    }
    auto total = static_cast<long long>(seconds);
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    total %= 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, total);
    }
    return fmt::format("{:02d}:{:02d}", minutes, total);
}

ProgressRenderer::ProgressRenderer(std::size_t path_width, bool enabled, std::FILE* out)
    : path_width_(path_width)
    , enabled_(enabled)
    , out_(out)
{}

ProgressRenderer::~ProgressRenderer() {
    finish();
}

auto ProgressRenderer::render_header_(const ProgressAggregator::Snapshot& snap) const -> std::string {
    const auto& c = snap.counters;
    const auto elapsed = std::chrono::duration<double>(snap.elapsed).count();
    auto line = fmt::format("[{}] {}/{} items",
                            format_duration(elapsed),
                            c.completed_files + c.failed_files, c.total_files);
    if (c.failed_files > 0) {
        line += fmt::format(fg(fmt::terminal_color::red), " ({} failed)", c.failed_files);
    }
    line += fmt::format(" | {} / {}", format_bytes(static_cast<double>(c.completed_bytes)),
                        format_bytes(static_cast<double>(c.total_bytes)));
    return line;
}

auto ProgressRenderer::render_entry_(const ProgressAggregator::ActiveEntry& entry) -> std::string {
    const double fraction = entry.bytes_total == 0
        ? 1.0
        : static_cast<double>(entry.bytes_done) / static_cast<double>(entry.bytes_total);

    double eta = -1.0;
    if (entry.rate > 0.0 && entry.bytes_total >= entry.bytes_done) {
        eta = static_cast<double>(entry.bytes_total - entry.bytes_done) / entry.rate;
    }

    return fmt::format("{} {} {} {:>10}/{:<10} {:>12} {:>8}",
        fmt::format(fmt::emphasis::bold | fg(fmt::terminal_color::cyan),
                    "{:<{}}", entry.display_path, path_width_),
        fmt::format(fg(fmt::terminal_color::green), "{}", kSpinner[(tick_ + entry.id) % kSpinner.size()]),
        fmt::format(fg(fmt::terminal_color::blue), "{}", make_bar(fraction)),
        format_bytes(static_cast<double>(entry.bytes_done)),
        format_bytes(static_cast<double>(entry.bytes_total)),
        format_bytes(entry.rate) + "/s",
        format_duration(eta));
}

void ProgressRenderer::draw(const ProgressAggregator::Snapshot& snap) {
    if (!enabled_) return;
    ++tick_;

    std::string frame;
    // ANSI: вернуться к началу предыдущего кадра
    if (lines_drawn_ > 0) {
        frame += fmt::format("\033[{}A", lines_drawn_);
    }
    frame += "\r\033[K" + render_header_(snap) + "\n";
    for (const auto& entry : snap.active) {
        frame += "\r\033[K" + render_entry_(entry) + "\n";
    }
    const auto lines = 1 + snap.active.size();
    // Лишние строки прошлого кадра очищаются
    for (auto i = lines; i < lines_drawn_; ++i) {
        frame += "\r\033[K\n";
    }
    if (lines_drawn_ > lines) {
        frame += fmt::format("\033[{}A", lines_drawn_ - lines);
    }

    fmt::print(out_, "{}", frame);
    std::fflush(out_);
    lines_drawn_ = lines;
}

void ProgressRenderer::finish() {
    if (!enabled_ || lines_drawn_ == 0) return;

    std::string frame = fmt::format("\033[{}A", lines_drawn_);
    for (std::size_t i = 0; i < lines_drawn_; ++i) {
        frame += "\r\033[K\n";
    }
    frame += fmt::format("\033[{}A", lines_drawn_);
    fmt::print(out_, "{}", frame);
    std::fflush(out_);
    lines_drawn_ = 0;
}

} // namespace pcopy::infra
