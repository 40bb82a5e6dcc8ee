/**
 * @file periodic_task.cpp
 * @brief Cancellable fixed-interval background task implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "utils/periodic_task.h"
#include "utils/logger.h"
#include "utils/error_handler.h"

namespace swarmnet {
namespace utils {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name))
    , interval_(interval)
    , callback_(std::move(callback))
    , running_(false)
    , run_count_(0) {
}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    running_ = true;
    thread_ = std::thread(&PeriodicTask::run, this);
    SWARMNET_LOG_DEBUG(GENERAL, "Periodic task started: " + name_ +
                       " (every " + std::to_string(interval_.count()) + " ms)");
    return true;
}

void PeriodicTask::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        worker = std::move(thread_);
    }
    condition_.notify_all();

    if (!worker.joinable()) {
        return;
    }

    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
    SWARMNET_LOG_DEBUG(GENERAL, "Periodic task stopped: " + name_);
}

void PeriodicTask::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait_for(lock, interval_, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }

        try {
            callback_();
            ++run_count_;
        } catch (const std::exception& e) {
            SWARMNET_ERROR(SYSTEM, "Periodic task " + name_ + " failed: " + e.what());
        }
    }
}

} // namespace utils
} // namespace swarmnet
