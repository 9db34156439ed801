/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for transfer worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::webhdfs::adapters::test {

TEST(TransferPoolTest, FactoryCreatesRequestedWorkers) {
    auto pool = transfer_pool_factory::create(3);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->worker_count(), 3u);
    EXPECT_TRUE(pool->is_running());
}

TEST(TransferPoolTest, AtLeastOneWorker) {
    fixed_transfer_pool pool(0);
    EXPECT_EQ(pool.worker_count(), 1u);
}

TEST(TransferPoolTest, RunsAllSubmittedTasks) {
    auto pool = transfer_pool_factory::create(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool->submit([&counter] { counter.fetch_add(1); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(TransferPoolTest, WorkersRunConcurrently) {
    fixed_transfer_pool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto task = [&] {
        int now = running.fetch_add(1) + 1;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        running.fetch_sub(1);
    };
    auto first = pool.submit(task);
    auto second = pool.submit(task);
    first.get();
    second.get();
    EXPECT_EQ(peak.load(), 2);
}

TEST(TransferPoolTest, ExceptionReachesFuture) {
    fixed_transfer_pool pool(1);
    auto future = pool.submit([] { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    auto next = pool.submit([] {});
    EXPECT_NO_THROW(next.get());
}

TEST(TransferPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    {
        fixed_transfer_pool pool(1);
        for (int i = 0; i < 10; ++i) {
            (void)pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(counter.load(), 10);
}

}  // namespace kcenon::webhdfs::adapters::test
