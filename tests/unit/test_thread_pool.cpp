/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for the blocking job pool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

TEST(ThreadPoolTest, ReturnsJobResult) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return std::string{"released"}; });
    EXPECT_EQ(future.get(), "released");
    EXPECT_EQ(pool.thread_count(), 2u);
}

TEST(ThreadPoolTest, BlockingJobsRunSideBySide) {
    // Two jobs that each wait for the other can only finish on separate workers.
    ThreadPool pool(2);
    std::promise<void> first_started, second_started;
    auto a = pool.submit([&] {
        first_started.set_value();
        second_started.get_future().wait();
    });
    auto b = pool.submit([&] {
        second_started.set_value();
        first_started.get_future().wait();
    });

    EXPECT_EQ(a.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(b.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(ThreadPoolTest, PollingWithZeroTimeout) {
    ThreadPool pool(1);
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    auto job = pool.submit([gate_future] { gate_future.wait(); return 7; });

    EXPECT_EQ(job.wait_for(std::chrono::seconds(0)), std::future_status::timeout);
    gate.set_value();
    EXPECT_EQ(job.get(), 7);
}

TEST(ThreadPoolTest, ExceptionPropagatesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("git worktree add failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives a throwing job.
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, DestructorRunsQueuedJobs) {
    std::atomic<int> released{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            (void)pool.submit([&released] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                released.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(released.load(), 10);
}
