/**
 * @file test_progress_tracker.cpp
 * @brief Unit tests for progress_tracker
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/transfer/progress_tracker.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::webhdfs::test {

TEST(ProgressTrackerTest, InitialState) {
    progress_tracker tracker(400, 2);
    EXPECT_EQ(tracker.pending_files(), 2u);
    EXPECT_EQ(tracker.active_files(), 0u);
    EXPECT_EQ(tracker.completed_files(), 0u);
    EXPECT_EQ(tracker.transferred_bytes(), 0u);
    EXPECT_DOUBLE_EQ(tracker.percent(), 0.0);
    EXPECT_EQ(tracker.render(), "0.0%\t[ pending: 2 | downloading: 0 | complete: 0 ]");
}

TEST(ProgressTrackerTest, CumulativeUpdatesReplaceLiveCount) {
    progress_tracker tracker(400, 2);
    tracker.update("/a", 50);
    tracker.update("/a", 100);

    EXPECT_EQ(tracker.live_paths(), 1u);
    EXPECT_EQ(tracker.live_bytes(), 100u);
    EXPECT_EQ(tracker.pending_files(), 1u);
    EXPECT_EQ(tracker.active_files(), 1u);
    EXPECT_EQ(tracker.render(), "25.0%\t[ pending: 1 | downloading: 1 | complete: 0 ]");
}

TEST(ProgressTrackerTest, DoneSignalFinalizesPath) {
    progress_tracker tracker(400, 2);
    tracker.update("/a", 200);
    tracker.update("/b", 100);
    tracker.update("/a", progress_done);

    EXPECT_EQ(tracker.live_paths(), 1u);
    EXPECT_EQ(tracker.live_bytes(), 100u);
    EXPECT_EQ(tracker.transferred_bytes(), 300u);
    EXPECT_EQ(tracker.completed_files(), 1u);
    EXPECT_EQ(tracker.active_files(), 1u);
    EXPECT_EQ(tracker.pending_files(), 0u);

    tracker.update("/b", 200);
    tracker.update("/b", progress_done);
    EXPECT_EQ(tracker.live_paths(), 0u);
    EXPECT_DOUBLE_EQ(tracker.percent(), 100.0);
    EXPECT_EQ(tracker.render(), "100.0%\t[ pending: 0 | downloading: 0 | complete: 2 ]");
}

TEST(ProgressTrackerTest, DoneWithoutPriorUpdateCountsFile) {
    progress_tracker tracker(0, 1);
    tracker.update("/failed", progress_done);
    EXPECT_EQ(tracker.completed_files(), 1u);
    EXPECT_EQ(tracker.pending_files(), 0u);
    EXPECT_EQ(tracker.active_files(), 0u);
    EXPECT_EQ(tracker.transferred_bytes(), 0u);
}

TEST(ProgressTrackerTest, NothingExpectedIsComplete) {
    progress_tracker tracker;
    EXPECT_DOUBLE_EQ(tracker.percent(), 100.0);
}

TEST(ProgressTrackerTest, WriterReceivesLineAfterEachUpdate) {
    progress_tracker tracker(100, 1);
    std::vector<std::string> lines;
    tracker.set_writer([&](const std::string& line) { lines.push_back(line); });

    auto callback = tracker.callback();
    callback("/f", 50);
    callback("/f", progress_done);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "50.0%\t[ pending: 0 | downloading: 1 | complete: 0 ]");
    EXPECT_EQ(lines[1], "50.0%\t[ pending: 0 | downloading: 0 | complete: 1 ]");
}

TEST(ProgressTrackerTest, WriterMayQueryTracker) {
    progress_tracker tracker(100, 1);
    std::vector<uint64_t> seen;
    std::vector<std::string> rendered;
    tracker.set_writer([&](const std::string&) {
        seen.push_back(tracker.transferred_bytes());
        rendered.push_back(tracker.render());
    });

    auto worker = std::async(std::launch::async, [&] {
        tracker.update("/a", 10);
        tracker.update("/a", progress_done);
    });
    ASSERT_EQ(worker.wait_for(std::chrono::seconds(10)), std::future_status::ready);

    EXPECT_EQ(seen, (std::vector<uint64_t>{10, 10}));
    ASSERT_EQ(rendered.size(), 2u);
    EXPECT_EQ(rendered[1], "10.0%\t[ pending: 0 | downloading: 0 | complete: 1 ]");
}

TEST(ProgressTrackerTest, ConcurrentWritersQueryingTracker) {
    constexpr int threads = 8;
    constexpr int updates = 100;
    progress_tracker tracker(threads * updates, threads);
    std::atomic<int> lines{0};
    tracker.set_writer([&](const std::string&) {
        (void)tracker.percent();
        ++lines;
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&tracker, t] {
            auto path = "/file-" + std::to_string(t);
            for (int i = 1; i <= updates; ++i) {
                tracker.update(path, i);
            }
            tracker.update(path, progress_done);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(lines.load(), threads * (updates + 1));
    EXPECT_EQ(tracker.transferred_bytes(), static_cast<uint64_t>(threads * updates));
    EXPECT_EQ(tracker.completed_files(), static_cast<std::size_t>(threads));
}

TEST(ProgressTrackerTest, ConcurrentUpdatesAreMerged) {
    constexpr int threads = 8;
    constexpr int steps = 100;
    progress_tracker tracker(threads * steps, threads);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&tracker, t] {
            auto path = "/file-" + std::to_string(t);
            for (int i = 1; i <= steps; ++i) {
                tracker.update(path, i);
            }
            tracker.update(path, progress_done);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(tracker.transferred_bytes(), static_cast<uint64_t>(threads * steps));
    EXPECT_EQ(tracker.completed_files(), static_cast<std::size_t>(threads));
    EXPECT_EQ(tracker.live_paths(), 0u);
}

}  // namespace kcenon::webhdfs::test
