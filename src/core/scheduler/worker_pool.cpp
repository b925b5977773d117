#include "worker_pool.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>
#include "../copy_engine/copy_primitive.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace pcopy::core {

WorkerPool::WorkerPool(WorkDistributor& distributor,
                       infra::ProgressAggregator& progress,
                       DiagnosticsReporter& reporter,
                       PoolOptions options)
    : distributor_(distributor)
    , progress_(progress)
    , reporter_(reporter)
    , options_(options)
{}

auto WorkerPool::worker_count(std::size_t max_workers, std::size_t task_count) -> std::size_t {
    return std::min(max_workers, task_count);
}

void WorkerPool::work_(std::stop_token st, WorkerOutcome& outcome) {
    while (auto task = distributor_.next(st)) {
        auto res = execute_task(*task, progress_, options_.buffer_size, st);
        if (res) {
            ++outcome.succeeded;
            outcome.bytes_copied += *res;
            continue;
        }

        auto& err = res.error();
        if (err.code == infra::ErrorCode::Interrupted) {
            outcome.interrupted = true;
        }
        auto failure = to_failure(err);
        reporter_.report(failure);
        outcome.failures.push_back(std::move(failure));
    }
}

auto WorkerPool::run(std::size_t task_count, const TickFn& on_tick) -> PoolResult {
    PoolResult result;
    result.workers = worker_count(options_.max_workers, task_count);
    if (result.workers == 0) {
        // Без воркеров задачи не выполняются, но учитываются как брошенные
        result.abandoned = distributor_.abandon();
        return result;
    }

    // Каждый воркер пишет только в свой слот
    std::vector<WorkerOutcome> outcomes(result.workers);
    bool stop_requested = false;
    {
        spdlog::debug("Starting {} workers for {} tasks", result.workers, task_count);
        infra::ThreadPool pool{result.workers, [this, &outcomes](std::stop_token st, std::size_t index) {
            work_(st, outcomes[index]);
        }};

        while (!pool.wait_for(options_.tick_interval)) {
            if (!stop_requested && on_tick && !on_tick()) {
                spdlog::debug("Stop requested, draining {} live workers", pool.live());
                pool.request_stop();
                stop_requested = true;
            }
        }
        pool.wait();
    }
    if (on_tick) {
        (void)on_tick();
    }

    for (auto& outcome : outcomes) {
        result.succeeded += outcome.succeeded;
        result.bytes_copied += outcome.bytes_copied;
        result.interrupted = result.interrupted || outcome.interrupted;
        std::move(outcome.failures.begin(), outcome.failures.end(), std::back_inserter(result.failures));
    }
    result.abandoned = distributor_.abandon();
    result.interrupted = result.interrupted || stop_requested;

    spdlog::debug("Workers finished: {} succeeded, {} failed, {} abandoned",
                  result.succeeded, result.failures.size(), result.abandoned);
    return result;
}

} // namespace pcopy::core
