#include "copy_engine.hpp"
#include <algorithm>
#include <iterator>
#include <numeric>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "copy_primitive.hpp"
#include "../enumerator/tree_enumerator.hpp"
#include "../scheduler/work_distributor.hpp"
#include "../scheduler/worker_pool.hpp"
#include "../../adapters/fs.hpp"

namespace pcopy::core {

namespace {

// "a/b/" и "a/b" сравниваются одинаково
auto without_trailing_separator(const std::filesystem::path& p) -> std::filesystem::path {
    auto normal = p.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        return normal.parent_path();
    }
    return normal;
}

// true, если path совпадает с root или лежит внутри него
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root) {
    const auto p = without_trailing_separator(path);
    const auto r = without_trailing_separator(root);
    return std::mismatch(r.begin(), r.end(), p.begin(), p.end()).first == r.end();
}

} // namespace

CopyEngine::CopyEngine(const infra::Config& config,
                       infra::ProgressAggregator& progress,
                       DiagnosticsReporter& reporter)
    : config_(config), progress_(progress), reporter_(reporter) {}

auto CopyEngine::resolve_file_destination_(const std::filesystem::path& source,
                                           const std::filesystem::path& destination) const
    -> std::filesystem::path
{
    std::error_code ec;
    // Существующий каталог (или ссылка на него): кладём внутрь под исходным именем
    if (std::filesystem::is_directory(destination, ec)) {
        return destination / source.filename();
    }
    return destination;
}

auto CopyEngine::check_tree_destination_(const std::filesystem::path& source,
                                         const std::filesystem::path& destination) const
    -> infra::VoidResult
{
    std::error_code ec;
    const auto status = std::filesystem::status(destination, ec);
    if (std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DestinationConflict,
                               fmt::format("Destination exists and is not a directory: {}", destination.string()),
                               destination));
    }

    const auto src_abs = std::filesystem::weakly_canonical(source, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot resolve source", source));
    }
    const auto dst_abs = std::filesystem::weakly_canonical(destination, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot resolve destination", destination));
    }
    if (is_within(dst_abs, src_abs)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("Cannot copy {} into itself ({})", source.string(), destination.string()),
                               destination));
    }
    return {};
}

auto CopyEngine::plan(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      const TickFn& on_tick)
    -> infra::Result<CopyPlan>
{
    Ticker ticker{on_tick, config_.refresh_interval};
    return plan_(source, destination, ticker);
}

auto CopyEngine::plan_(const std::filesystem::path& source,
                       const std::filesystem::path& destination,
                       Ticker& ticker)
    -> infra::Result<CopyPlan>
{
    auto info = adapters::fs::classify(source);
    if (!info) {
        return std::unexpected(std::move(info.error()).as_fatal());
    }
    spdlog::debug("Source {} is a {}", source.string(), to_string(info->kind));

    CopyPlan plan;

    if (info->kind != EntryKind::Directory) {
        plan.destination = resolve_file_destination_(source, destination);
        std::error_code ec;
        if (std::filesystem::equivalent(source, plan.destination, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                                   fmt::format("{} and {} are the same file", source.string(),
                                               plan.destination.string()),
                                   plan.destination).as_fatal());
        }
        plan.transfers.push_back(CopyTask{
            .source = source,
            .destination = plan.destination,
            .kind = info->kind,
            .size_bytes = info->size
        });
        return plan;
    }

    if (auto checked = check_tree_destination_(source, destination); !checked) {
        return std::unexpected(std::move(checked.error()).as_fatal());
    }
    plan.destination = destination;

    TreeEnumerator enumerator{source, destination};
    while (auto task = enumerator.next()) {
        if (!ticker.poll()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                   "Interrupted while enumerating source tree", source).as_fatal());
        }
        if (task->kind == EntryKind::Directory) {
            plan.directories.push_back(std::move(*task));
        } else {
            plan.transfers.push_back(std::move(*task));
        }
    }
    plan.enumeration_errors = enumerator.errors();

    spdlog::debug("Enumerated {} directories, {} files/links, {} errors",
                  plan.directories.size(), plan.transfers.size(), plan.enumeration_errors.size());
    return plan;
}

auto CopyEngine::run(const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     const TickFn& on_tick)
    -> infra::Result<CopyReport>
{
    const auto start_time = std::chrono::steady_clock::now();
    Ticker ticker{on_tick, config_.refresh_interval};

    auto planned = plan_(source, destination, ticker);
    if (!planned) {
        return std::unexpected(std::move(planned.error()));
    }
    auto& p = *planned;

    const auto total_bytes = std::accumulate(p.transfers.begin(), p.transfers.end(), std::uint64_t{0},
        [](std::uint64_t acc, const CopyTask& t) { return acc + t.size_bytes; });
    progress_.add_total(p.task_count() + p.enumeration_errors.size(), total_bytes);

    CopyReport report;
    report.attempted = p.task_count() + p.enumeration_errors.size();

    // Первым идёт корень назначения: если его не создать, копировать некуда
    auto dir = p.directories.begin();
    if (dir != p.directories.end()) {
        auto root = execute_task(*dir, progress_, config_.buffer_size);
        if (!root) {
            return std::unexpected(std::move(root.error()).as_fatal());
        }
        ++report.succeeded;
        ++dir;
    }

    for (const auto& err : p.enumeration_errors) {
        progress_.record_failed();
        auto failure = to_failure(err);
        reporter_.report(failure);
        report.failures.push_back(std::move(failure));
    }

    // Каталоги создаются до того, как воркеры начнут писать файлы в них
    bool stopped = false;
    for (; dir != p.directories.end(); ++dir) {
        if (!ticker.poll()) {
            stopped = true;
            break;
        }
        auto res = execute_task(*dir, progress_, config_.buffer_size);
        if (res) {
            ++report.succeeded;
        } else {
            auto failure = to_failure(res.error());
            reporter_.report(failure);
            report.failures.push_back(std::move(failure));
        }
    }
    if (!stopped && on_tick && !on_tick()) {
        stopped = true;
    }
    if (stopped) {
        spdlog::debug("Stop requested before workers started");
        report.interrupted = true;
        report.abandoned = static_cast<std::uint64_t>(std::distance(dir, p.directories.end()))
                         + p.transfers.size();
        report.elapsed = std::chrono::steady_clock::now() - start_time;
        return report;
    }

    WorkDistributor distributor{std::move(p.transfers)};
    WorkerPool pool{distributor, progress_, reporter_, PoolOptions{
        .max_workers = config_.max_workers,
        .buffer_size = config_.buffer_size,
        .tick_interval = config_.refresh_interval
    }};
    auto pooled = pool.run(distributor.submitted(), on_tick);

    report.succeeded += pooled.succeeded;
    report.bytes_copied = pooled.bytes_copied;
    report.abandoned = pooled.abandoned;
    report.workers = pooled.workers;
    report.interrupted = pooled.interrupted;
    std::move(pooled.failures.begin(), pooled.failures.end(), std::back_inserter(report.failures));
    report.elapsed = std::chrono::steady_clock::now() - start_time;
    return report;
}

} // namespace pcopy::core
