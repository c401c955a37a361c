/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the bounded worker pool
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::media_fetch::adapters::test {

class BoundedTransferPoolTest : public ::testing::Test {};

TEST_F(BoundedTransferPoolTest, RunsEveryTask) {
    bounded_transfer_pool pool(4);
    EXPECT_EQ(pool.worker_count(), 4u);
    EXPECT_TRUE(pool.is_running());

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST_F(BoundedTransferPoolTest, NeverExceedsWorkerCount) {
    bounded_transfer_pool pool(2);

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&] {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_LE(peak.load(), 2);
}

TEST_F(BoundedTransferPoolTest, ExceptionReachesFuture) {
    bounded_transfer_pool pool(1);
    auto future = pool.submit([] { throw std::runtime_error("segment failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    auto next = pool.submit([] {});
    EXPECT_NO_THROW(next.get());
}

TEST_F(BoundedTransferPoolTest, StageTracking) {
    bounded_transfer_pool pool(1);

    std::promise<void> gate;
    auto gate_future = gate.get_future().share();

    auto blocked = pool.submit_to_stage([gate_future] { gate_future.wait(); },
                                        "segment_download");
    auto queued = pool.submit_to_stage([] {}, "segment_download");

    EXPECT_EQ(pool.pending_tasks("segment_download"), 2u);
    EXPECT_EQ(pool.pending_tasks("file_transfer"), 0u);

    gate.set_value();
    blocked.get();
    queued.get();
    EXPECT_EQ(pool.pending_tasks("segment_download"), 0u);
}

TEST_F(BoundedTransferPoolTest, SubmitAfterShutdownFails) {
    bounded_transfer_pool pool(2);
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());

    auto future = pool.submit([] {});
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(BoundedTransferPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> counter{0};
    {
        bounded_transfer_pool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.submit([&counter] { ++counter; });
        }
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(TransferPoolFactoryTest, CreatesRunningPool) {
    auto pool = transfer_pool_factory::create(3, "test_pool");
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 3u);

    auto future = pool->submit([] {});
    EXPECT_NO_THROW(future.get());
}

TEST(TransferPoolFactoryTest, BackendMatchesBuild) {
    auto pool = transfer_pool_factory::create(2, "backend_pool");
    auto bounded = std::dynamic_pointer_cast<bounded_transfer_pool>(pool);
    if (transfer_pool_factory::has_thread_system()) {
        EXPECT_EQ(bounded, nullptr);
    } else {
        EXPECT_NE(bounded, nullptr);
    }
}

}  // namespace kcenon::media_fetch::adapters::test
