/// @file thread_pool_test.cpp
/// @brief Tests for the InsightX thread pool and RunWithTimeout

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "common/thread_pool.h"

namespace insightx {
namespace {

TEST(ThreadPoolTest, BasicExecution) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() { return 42; });

    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.Submit([&counter]() {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, Wait) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        pool.Submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            counter.fetch_add(1);
        });
    }

    pool.Wait();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, Size) {
    ThreadPool pool(8);
    EXPECT_EQ(pool.Size(), 8u);

    ThreadPool default_pool;
    EXPECT_GT(default_pool.Size(), 0u);
}

TEST(RunWithTimeoutTest, ReturnsResultWithinDeadline) {
    ThreadPool pool(1);

    auto result = RunWithTimeout<int>(pool, std::chrono::milliseconds(1000), "Lookup",
                                      []() -> absl::StatusOr<int> { return 7; });

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result, 7);
}

TEST(RunWithTimeoutTest, PropagatesCallError) {
    ThreadPool pool(1);

    auto result = RunWithTimeout<int>(pool, std::chrono::milliseconds(1000), "Lookup",
                                      []() -> absl::StatusOr<int> {
                                          return absl::UnavailableError("down");
                                      });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnavailable);
}

TEST(RunWithTimeoutTest, DeadlineYieldsResourceExhausted) {
    ThreadPool pool(1);

    auto result = RunWithTimeout<int>(pool, std::chrono::milliseconds(20), "Slow call",
                                      []() -> absl::StatusOr<int> {
                                          std::this_thread::sleep_for(
                                              std::chrono::milliseconds(300));
                                          return 1;
                                      });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(GetErrorCode(result.status()), ErrorCode::kResourceExhausted);
    EXPECT_NE(result.status().message().find("Slow call"), std::string::npos);
}

}  // namespace
}  // namespace insightx
