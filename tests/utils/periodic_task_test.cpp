/**
 * @file periodic_task_test.cpp
 * @brief Tests for the periodic worker used by heartbeats and metrics
 */

#include <gtest/gtest.h>
#include "utils/periodic_task.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace swarmnet {
namespace tests {

using namespace std::chrono_literals;
using utils::PeriodicTask;

TEST(PeriodicTaskTest, RunsRepeatedlyUntilStopped) {
    std::atomic<int> calls{0};
    PeriodicTask task("counter", 10ms, [&calls]() { calls++; });

    EXPECT_TRUE(task.start());
    EXPECT_FALSE(task.start());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (calls < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    task.stop();

    EXPECT_GE(calls.load(), 3);
    EXPECT_FALSE(task.isRunning());

    int after_stop = calls;
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), after_stop);
}

TEST(PeriodicTaskTest, WaitsOneIntervalBeforeFirstRun) {
    std::atomic<int> calls{0};
    PeriodicTask task("slow", std::chrono::hours(1), [&calls]() { calls++; });

    ASSERT_TRUE(task.start());
    std::this_thread::sleep_for(30ms);
    task.stop();

    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(task.getRunCount(), 0u);
}

TEST(PeriodicTaskTest, ThrowingCallbackKeepsRunning) {
    std::atomic<int> calls{0};
    PeriodicTask task("flaky", 5ms, [&calls]() {
        if (calls++ == 0) {
            throw std::runtime_error("first run fails");
        }
    });

    ASSERT_TRUE(task.start());
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (task.getRunCount() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    task.stop();

    EXPECT_GE(task.getRunCount(), 2u);
    EXPECT_GT(static_cast<uint64_t>(calls.load()), task.getRunCount());
}

} // namespace tests
} // namespace swarmnet
