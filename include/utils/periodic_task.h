/**
 * @file periodic_task.h
 * @brief Cancellable fixed-interval background task
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <atomic>

namespace swarmnet {
namespace utils {

/**
 * @brief Runs a callback on its own thread every interval until stopped
 *
 * stop() wakes the worker immediately instead of waiting for the current
 * interval to elapse. Exceptions thrown by the callback are reported and
 * the task keeps running.
 */
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    /**
     * @param name Task name used in log messages
     * @param interval Time between invocations
     * @param callback Work to perform
     */
    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Start the worker thread
     * @return False if already running
     */
    bool start();

    /**
     * @brief Stop the worker thread and wait for it to exit
     *
     * Safe to call from inside the callback; the worker then exits after
     * the callback returns.
     */
    void stop();

    bool isRunning() const { return running_; }
    const std::string& getName() const { return name_; }
    std::chrono::milliseconds getInterval() const { return interval_; }
    uint64_t getRunCount() const { return run_count_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> run_count_;

    void run();
};

} // namespace utils
} // namespace swarmnet
