/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the traditional-path worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

namespace kcenon::object_transfer::test {

using adapters::async_worker_pool;
using adapters::make_worker_pool;
using adapters::run_worker_loops;

class WorkerPoolTest : public ::testing::Test {};

TEST_F(WorkerPoolTest, LoopsShareOneWorkQueue) {
    async_worker_pool pool(4);
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> done{0};

    auto run = run_worker_loops(pool, 4, [&] {
        while (next.fetch_add(1) < 100) {
            done.fetch_add(1);
        }
    });

    EXPECT_EQ(run.launched, 4u);
    EXPECT_TRUE(run.failures.empty());
    EXPECT_EQ(done.load(), 100u);
    EXPECT_EQ(pool.capacity(), 4u);
}

TEST_F(WorkerPoolTest, LoopsRunConcurrently) {
    async_worker_pool pool(2);
    std::promise<void> first_started;
    auto started = first_started.get_future().share();
    std::atomic<int> entered{0};

    // The second loop only finishes once the first is running too
    auto run = run_worker_loops(pool, 2, [&] {
        if (entered.fetch_add(1) == 0) {
            first_started.set_value();
        } else {
            started.wait();
        }
    });

    EXPECT_EQ(run.launched, 2u);
    EXPECT_EQ(entered.load(), 2);
}

TEST_F(WorkerPoolTest, ThrowingLoopIsReportedAndOthersFinish) {
    async_worker_pool pool(3);
    std::atomic<int> calls{0};
    std::atomic<int> finished{0};

    auto run = run_worker_loops(pool, 3, [&] {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("staging disk full");
        }
        finished.fetch_add(1);
    });

    EXPECT_EQ(run.launched, 3u);
    ASSERT_EQ(run.failures.size(), 1u);
    EXPECT_EQ(run.failures[0], "staging disk full");
    EXPECT_EQ(finished.load(), 2);
}

TEST_F(WorkerPoolTest, ZeroWorkersLaunchNothing) {
    async_worker_pool pool(2);
    bool ran = false;

    auto run = run_worker_loops(pool, 0, [&] { ran = true; });

    EXPECT_EQ(run.launched, 0u);
    EXPECT_FALSE(ran);
}

TEST_F(WorkerPoolTest, FactoryPicksAvailablePool) {
    auto pool = make_worker_pool(3);

    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->capacity(), 3u);
    if (!adapters::has_thread_system()) {
        EXPECT_NE(dynamic_cast<async_worker_pool*>(pool.get()), nullptr);
    }
    EXPECT_EQ(make_worker_pool(0)->capacity(), 1u);

    std::atomic<bool> ran{false};
    pool->launch([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());
}

}  // namespace kcenon::object_transfer::test
