/// @file worker_pool_test.cpp
/// @brief Tests for the evalkit worker pool

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "common/worker_pool.h"

namespace evalkit {
namespace {

TEST(WorkerPoolTest, BasicExecution) {
    WorkerPool pool(2);

    auto future = pool.Submit([]() { return 42; });

    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, SubmitWithArguments) {
    WorkerPool pool(2);

    auto future = pool.Submit([](int a, int b) { return a + b; }, 40, 2);

    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, MultipleSubmissions) {
    WorkerPool pool(4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.Submit([i]() { return i * 2; }));
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
}

TEST(WorkerPoolTest, Wait) {
    WorkerPool pool(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        pool.Execute([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            counter.fetch_add(1);
        });
    }

    pool.Wait();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(WorkerPoolTest, PendingTasks) {
    WorkerPool pool(1);

    for (int i = 0; i < 5; ++i) {
        pool.Execute([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        });
    }

    EXPECT_GT(pool.PendingTasks(), 0u);

    pool.Wait();

    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(WorkerPoolTest, NeverExceedsWorkerCount) {
    WorkerPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

    for (int i = 0; i < 30; ++i) {
        pool.Execute([&]() {
            int now = running.fetch_add(1) + 1;
            int prev = max_running.load();
            while (now > prev && !max_running.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            running.fetch_sub(1);
        });
    }
    pool.Wait();

    EXPECT_LE(max_running.load(), 3);
    EXPECT_LE(pool.PeakActive(), 3u);
    EXPECT_GE(pool.PeakActive(), 1u);
}

TEST(WorkerPoolTest, ExceptionHandling) {
    WorkerPool pool(2);

    auto future = pool.Submit([]() -> int {
        throw std::runtime_error("Test exception");
    });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, Size) {
    WorkerPool pool(8);
    EXPECT_EQ(pool.Size(), 8u);
}

TEST(WorkerPoolTest, DefaultSize) {
    WorkerPool pool;
    EXPECT_GT(pool.Size(), 0u);
    EXPECT_FALSE(pool.IsStopped());
}

TEST(WorkerPoolTest, DestructorRunsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.Execute([&counter]() { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 5);
}

}  // namespace
}  // namespace evalkit
