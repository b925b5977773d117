#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "infra/monitoring/monitoring.hpp"
#include "infra/monitoring/renderer.hpp"

using pcopy::infra::ProgressAggregator;

TEST(TruncatePathTest, ShortPathUnchanged)
{
    EXPECT_EQ(pcopy::infra::truncate_display_path("a/b.txt", 30), "a/b.txt");
}

TEST(TruncatePathTest, LongPathKeepsTailWithEllipsis)
{
    const std::string p = "very/long/directory/name/with/file.bin";
    auto shown = pcopy::infra::truncate_display_path(p, 12);
    EXPECT_EQ(shown.size(), 12u);
    EXPECT_EQ(shown, ".../file.bin");
    EXPECT_EQ(shown.substr(0, 3), "...");
}

TEST(TruncatePathTest, TinyWidthKeepsTailOnly)
{
    EXPECT_EQ(pcopy::infra::truncate_display_path("abcdef", 3), "def");
}

TEST(TruncatePathTest, MultibyteCharactersAreNotSplit)
{
    auto shown = pcopy::infra::truncate_display_path("/данные/отчёт.txt", 10);
    EXPECT_EQ(shown, "...чёт.txt");
    EXPECT_EQ(pcopy::infra::truncate_display_path("отчёт", 5), "отчёт");
    EXPECT_EQ(pcopy::infra::truncate_display_path("отчёт", 2), "ёт");
}

TEST(ProgressAggregatorTest, EntryLivesOnlyWhileInProgress)
{
    ProgressAggregator progress{30};
    progress.add_total(1, 100);

    auto id = progress.begin("dir/file", 100);
    EXPECT_EQ(progress.active_count(), 1u);

    progress.advance(id, 60);
    auto snap = progress.snapshot();
    ASSERT_EQ(snap.active.size(), 1u);
    EXPECT_EQ(snap.active[0].bytes_done, 60u);
    EXPECT_EQ(snap.active[0].bytes_total, 100u);
    EXPECT_EQ(snap.active[0].display_path, "dir/file");

    progress.advance(id, 40);
    progress.complete(id);
    EXPECT_EQ(progress.active_count(), 0u);

    auto c = progress.counters();
    EXPECT_EQ(c.total_files, 1u);
    EXPECT_EQ(c.completed_files, 1u);
    EXPECT_EQ(c.completed_bytes, 100u);
    EXPECT_EQ(c.failed_files, 0u);
}

TEST(ProgressAggregatorTest, ZeroByteFileCompletesImmediately)
{
    ProgressAggregator progress;
    auto id = progress.begin("empty", 0);
    progress.complete(id);
    EXPECT_EQ(progress.active_count(), 0u);
    EXPECT_EQ(progress.counters().completed_files, 1u);
}

TEST(ProgressAggregatorTest, FailureRemovesEntry)
{
    ProgressAggregator progress;
    auto id = progress.begin("bad", 10);
    progress.advance(id, 5);
    progress.fail(id);
    EXPECT_EQ(progress.active_count(), 0u);
    EXPECT_EQ(progress.counters().failed_files, 1u);
    EXPECT_EQ(progress.counters().completed_files, 0u);
}

TEST(ProgressAggregatorTest, LongPathsAreTruncatedForDisplay)
{
    ProgressAggregator progress{10};
    auto id = progress.begin("a/very/long/path/name.txt", 1);
    auto snap = progress.snapshot();
    ASSERT_EQ(snap.active.size(), 1u);
    EXPECT_EQ(snap.active[0].display_path.size(), 10u);
    progress.complete(id);
}

TEST(ProgressAggregatorTest, RateIsComputedFromRecentSamples)
{
    ProgressAggregator progress;
    auto id = progress.begin("f", 1'000'000);
    progress.advance(id, 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    progress.advance(id, 1000);
    auto snap = progress.snapshot();
    ASSERT_EQ(snap.active.size(), 1u);
    EXPECT_GT(snap.active[0].rate, 0.0);
    progress.complete(id);
}

TEST(ProgressAggregatorTest, StalledFileRateDecaysToZero)
{
    ProgressAggregator progress;
    auto id = progress.begin("stalled", 1'000'000);
    progress.advance(id, 4096);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    progress.advance(id, 4096);
    ASSERT_GT(progress.snapshot().active[0].rate, 0.0);

    std::this_thread::sleep_for(ProgressAggregator::kRateWindow + std::chrono::milliseconds(100));
    auto snap = progress.snapshot();
    ASSERT_EQ(snap.active.size(), 1u);
    EXPECT_EQ(snap.active[0].rate, 0.0);
    EXPECT_EQ(snap.active[0].bytes_done, 8192u);
    progress.complete(id);
}

TEST(ProgressAggregatorTest, ConcurrentUpdatesLoseNothing)
{
    constexpr int kThreads = 8;
    constexpr int kFilesPerThread = 200;
    constexpr int kChunks = 10;

    ProgressAggregator progress;
    std::atomic<std::size_t> max_active{0};
    std::atomic<bool> done{false};

    std::jthread observer([&] {
        while (!done.load()) {
            auto n = progress.snapshot().active.size();
            auto prev = max_active.load();
            while (n > prev && !max_active.compare_exchange_weak(prev, n)) {}
        }
    });

    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&] {
                for (int f = 0; f < kFilesPerThread; ++f) {
                    auto id = progress.begin("file", kChunks);
                    for (int c = 0; c < kChunks; ++c) progress.advance(id, 1);
                    progress.complete(id);
                }
            });
        }
    }
    done = true;
    observer.join();

    auto c = progress.counters();
    EXPECT_EQ(c.completed_files, static_cast<std::uint64_t>(kThreads * kFilesPerThread));
    EXPECT_EQ(c.completed_bytes, static_cast<std::uint64_t>(kThreads * kFilesPerThread * kChunks));
    EXPECT_EQ(progress.active_count(), 0u);
    EXPECT_LE(max_active.load(), static_cast<std::size_t>(kThreads));
}

TEST(FormatTest, BytesUseBinaryUnits)
{
    EXPECT_EQ(pcopy::infra::format_bytes(512), "512.0 B");
    EXPECT_EQ(pcopy::infra::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(pcopy::infra::format_bytes(3.0 * 1024 * 1024), "3.0 MB");
}

TEST(FormatTest, Durations)
{
    EXPECT_EQ(pcopy::infra::format_duration(65), "01:05");
    EXPECT_EQ(pcopy::infra::format_duration(3661), "01:01:01");
    EXPECT_EQ(pcopy::infra::format_duration(-1), "--:--");
}

TEST(ProgressRendererTest, DisabledRendererWritesNothing)
{
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    {
        pcopy::infra::ProgressRenderer renderer{30, false, out};
        ProgressAggregator progress;
        auto id = progress.begin("file", 10);
        renderer.draw(progress.snapshot());
        progress.complete(id);
    }
    EXPECT_EQ(std::ftell(out), 0L);
    std::fclose(out);
}

TEST(ProgressRendererTest, DrawsHeaderAndOneLinePerActiveFile)
{
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    pcopy::infra::ProgressRenderer renderer{30, true, out};
    ProgressAggregator progress;
    progress.add_total(2, 20);
    auto a = progress.begin("alpha.bin", 10);
    auto b = progress.begin("beta.bin", 10);
    renderer.draw(progress.snapshot());

    std::fflush(out);
    std::rewind(out);
    std::string text;
    char buf[4096];
    while (auto n = std::fread(buf, 1, sizeof(buf), out)) text.append(buf, n);
    EXPECT_NE(text.find("0/2 items"), std::string::npos);
    EXPECT_NE(text.find("alpha.bin"), std::string::npos);
    EXPECT_NE(text.find("beta.bin"), std::string::npos);

    progress.complete(a);
    progress.complete(b);
    renderer.finish();
    std::fclose(out);
}
