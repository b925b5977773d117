#include "test_utils.hpp"

#include "core/scheduler/work_distributor.hpp"
#include "core/scheduler/worker_pool.hpp"
#include "infra/monitoring/monitoring.hpp"

using pcopy::core::CopyTask;
using pcopy::core::EntryKind;
using pcopy::core::PoolOptions;
using pcopy::core::WorkDistributor;
using pcopy::core::WorkerPool;

class WorkerPoolTest : public pcopy::testing::TempDirTest {
protected:
    auto make_file_tasks(int count, std::size_t size) -> std::vector<CopyTask> {
        std::filesystem::create_directories(path("out"));
        std::vector<CopyTask> tasks;
        for (int i = 0; i < count; ++i) {
            auto name = "f" + std::to_string(i);
            write_file(path("in/" + name), random_bytes(size, static_cast<unsigned>(i)));
            tasks.push_back(CopyTask{
                .source = path("in/" + name),
                .destination = path("out/" + name),
                .kind = EntryKind::File,
                .size_bytes = size
            });
        }
        return tasks;
    }
};

TEST(WorkerCountTest, BoundedByTasksAndMaximum)
{
    EXPECT_EQ(WorkerPool::worker_count(10, 3), 3u);
    EXPECT_EQ(WorkerPool::worker_count(10, 500), 10u);
    EXPECT_EQ(WorkerPool::worker_count(4, 0), 0u);
}

TEST(WorkDistributorTest, SealedQueueExhausts)
{
    WorkDistributor distributor{std::vector<CopyTask>(3)};
    EXPECT_EQ(distributor.submitted(), 3u);
    int n = 0;
    while (distributor.next()) ++n;
    EXPECT_EQ(n, 3);
    EXPECT_EQ(distributor.dispatched(), 3u);
    EXPECT_EQ(distributor.pending(), 0u);
}

TEST_F(WorkerPoolTest, EveryTaskRunsExactlyOnce)
{
    constexpr int kTasks = 120;
    auto tasks = make_file_tasks(kTasks, 3000);

    WorkDistributor distributor{tasks};
    pcopy::infra::ProgressAggregator progress;
    progress.add_total(kTasks, kTasks * 3000);
    pcopy::testing::RecordingReporter reporter;

    std::size_t max_active = 0;
    WorkerPool pool{distributor, progress, reporter, PoolOptions{
        .max_workers = 6, .buffer_size = 1024, .tick_interval = std::chrono::milliseconds(1)}};
    auto result = pool.run(distributor.submitted(), [&] {
        max_active = std::max(max_active, progress.active_count());
        return true;
    });

    EXPECT_EQ(result.workers, 6u);
    EXPECT_EQ(result.succeeded, static_cast<std::uint64_t>(kTasks));
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(result.bytes_copied, static_cast<std::uint64_t>(kTasks) * 3000u);
    EXPECT_EQ(distributor.dispatched(), static_cast<std::size_t>(kTasks));
    EXPECT_EQ(progress.counters().completed_files, static_cast<std::uint64_t>(kTasks));
    EXPECT_EQ(progress.active_count(), 0u);
    EXPECT_LE(max_active, 6u);

    for (const auto& t : tasks) {
        EXPECT_EQ(read_file(t.destination), read_file(t.source));
    }
}

TEST_F(WorkerPoolTest, FailedTaskDoesNotStopOthers)
{
    auto tasks = make_file_tasks(10, 100);
    tasks.push_back(CopyTask{
        .source = path("in/missing"),
        .destination = path("out/missing"),
        .kind = EntryKind::File,
        .size_bytes = 5
    });

    WorkDistributor distributor{tasks};
    pcopy::infra::ProgressAggregator progress;
    pcopy::testing::RecordingReporter reporter;
    WorkerPool pool{distributor, progress, reporter, PoolOptions{.max_workers = 3}};
    auto result = pool.run(distributor.submitted());

    EXPECT_EQ(result.succeeded, 10u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, path("in/missing"));
    EXPECT_EQ(result.failures[0].error_kind, pcopy::infra::ErrorCode::NotFound);
    EXPECT_EQ(reporter.failures().size(), 1u);
    EXPECT_EQ(progress.counters().failed_files, 1u);
    EXPECT_EQ(progress.active_count(), 0u);
}

TEST_F(WorkerPoolTest, StopFromTickDrainsGracefully)
{
    constexpr int kTasks = 200;
    auto tasks = make_file_tasks(kTasks, 64 * 1024);

    WorkDistributor distributor{tasks};
    pcopy::infra::ProgressAggregator progress;
    pcopy::testing::RecordingReporter reporter;
    WorkerPool pool{distributor, progress, reporter, PoolOptions{
        .max_workers = 2, .buffer_size = 4096, .tick_interval = std::chrono::milliseconds(1)}};
    auto result = pool.run(distributor.submitted(), [] { return false; });

    EXPECT_TRUE(result.interrupted);
    // Каждая задача либо выполнена, либо упала, либо брошена, но не потеряна
    EXPECT_EQ(result.succeeded + result.failures.size() + result.abandoned,
              static_cast<std::uint64_t>(kTasks));
    EXPECT_GT(result.abandoned, 0u);
    EXPECT_EQ(progress.active_count(), 0u);
    for (const auto& f : result.failures) {
        EXPECT_EQ(f.error_kind, pcopy::infra::ErrorCode::Interrupted);
    }
}

TEST_F(WorkerPoolTest, NoTasksStartsNoWorkers)
{
    WorkDistributor distributor{std::vector<CopyTask>{}};
    pcopy::infra::ProgressAggregator progress;
    pcopy::testing::RecordingReporter reporter;
    WorkerPool pool{distributor, progress, reporter, PoolOptions{}};
    auto result = pool.run(0);
    EXPECT_EQ(result.workers, 0u);
    EXPECT_EQ(result.succeeded, 0u);
}

TEST_F(WorkerPoolTest, ZeroWorkersAccountsTasksAsAbandoned)
{
    WorkDistributor distributor{std::vector<CopyTask>(4)};
    pcopy::infra::ProgressAggregator progress;
    pcopy::testing::RecordingReporter reporter;
    WorkerPool pool{distributor, progress, reporter, PoolOptions{.max_workers = 0}};
    auto result = pool.run(distributor.submitted());
    EXPECT_EQ(result.workers, 0u);
    EXPECT_EQ(result.succeeded, 0u);
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(result.abandoned, 4u);
}
