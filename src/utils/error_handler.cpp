/**
 * @file error_handler.cpp
 * @brief Error reporting and tracking implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "utils/error_handler.h"
#include "utils/logger.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <thread>
#include <cstdlib>
#include <execinfo.h>

namespace swarmnet {
namespace utils {

namespace {

constexpr size_t kMaxErrorHistory = 1000;
constexpr int kMaxStackFrames = 16;

LogLevel toLogLevel(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::DEBUG: return LogLevel::DEBUG;
        case ErrorSeverity::INFO: return LogLevel::INFO;
        case ErrorSeverity::WARNING: return LogLevel::WARNING;
        case ErrorSeverity::ERROR: return LogLevel::ERROR;
        case ErrorSeverity::CRITICAL: return LogLevel::CRITICAL;
        case ErrorSeverity::FATAL: return LogLevel::FATAL;
    }
    return LogLevel::ERROR;
}

LogCategory toLogCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NETWORKING: return LogCategory::NETWORKING;
        case ErrorCategory::TRANSPORT: return LogCategory::TRANSPORT;
        case ErrorCategory::AGENT: return LogCategory::AGENT;
        case ErrorCategory::TOPOLOGY: return LogCategory::TOPOLOGY;
        case ErrorCategory::EVENTS: return LogCategory::EVENTS;
        case ErrorCategory::CONFIGURATION: return LogCategory::CONFIGURATION;
        case ErrorCategory::CLI: return LogCategory::CLI;
        default: return LogCategory::GENERAL;
    }
}

} // namespace

std::unique_ptr<ErrorHandler> ErrorHandler::instance_ = nullptr;
std::mutex ErrorHandler::instance_mutex_;

std::string ErrorHandler::reportError(ErrorSeverity severity,
                                      ErrorCategory category,
                                      const std::string& message,
                                      const std::string& file,
                                      int line,
                                      const std::string& function,
                                      const std::map<std::string, std::string>& context) {
    auto& instance = getInstance();

    ErrorInfo error;
    error.severity = severity;
    error.category = category;
    error.message = message;
    error.file = file;
    error.line = line;
    error.function = function;
    error.timestamp = std::chrono::system_clock::now();
    error.context = context;

    std::stringstream tid;
    tid << std::this_thread::get_id();
    error.thread_id = tid.str();

    bool collect_trace;
    {
        std::lock_guard<std::mutex> lock(instance.mutex_);
        error.id = instance.generateErrorId();
        collect_trace = instance.stack_trace_enabled_ && severity >= ErrorSeverity::ERROR;
    }

    if (collect_trace) {
        error.stack_trace = instance.collectStackTrace();
    }

    instance.writeToLog(error);

    {
        std::lock_guard<std::mutex> lock(instance.mutex_);
        std::string key = getSeverityName(severity) + "_" + getCategoryName(category);
        instance.error_statistics_[key]++;
        instance.category_counts_[{category, severity}]++;

        instance.error_history_.push_back(error);
        if (instance.error_history_.size() > kMaxErrorHistory) {
            instance.error_history_.erase(instance.error_history_.begin());
        }
    }

    instance.notifyCallbacks(error);
    return error.id;
}

size_t ErrorHandler::registerCallback(ErrorCallback callback) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    size_t handle = instance.next_callback_handle_++;
    instance.callbacks_[handle] = std::move(callback);
    return handle;
}

void ErrorHandler::unregisterCallback(size_t handle) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.callbacks_.erase(handle);
}

std::map<std::string, size_t> ErrorHandler::getErrorStatistics() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    return instance.error_statistics_;
}

size_t ErrorHandler::countErrors(ErrorCategory category, ErrorSeverity min_severity) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);

    size_t total = 0;
    for (const auto& [key, count] : instance.category_counts_) {
        if (key.first == category && key.second >= min_severity) {
            total += count;
        }
    }
    return total;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);

    size_t start = (instance.error_history_.size() > count) ?
                   instance.error_history_.size() - count : 0;

    return std::vector<ErrorInfo>(instance.error_history_.begin() + start,
                                  instance.error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.error_history_.clear();
    instance.error_statistics_.clear();
    instance.category_counts_.clear();
}

void ErrorHandler::setMinimumSeverity(ErrorSeverity severity) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.minimum_severity_ = severity;
}

void ErrorHandler::setStackTraceEnabled(bool enabled) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.stack_trace_enabled_ = enabled;
}

ErrorHandler::ErrorHandler()
    : next_callback_handle_(1)
    , stack_trace_enabled_(false)
    , minimum_severity_(ErrorSeverity::DEBUG)
    , sequence_(0) {
}

ErrorHandler& ErrorHandler::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_unique<ErrorHandler>();
    }
    return *instance_;
}

std::string ErrorHandler::generateErrorId() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << "err_" << std::hex << millis << "_" << std::setw(4) << std::setfill('0') << (++sequence_ & 0xffff);
    return ss.str();
}

std::vector<std::string> ErrorHandler::collectStackTrace() const {
    std::vector<std::string> stack_trace;

    void* frames[kMaxStackFrames];
    int size = backtrace(frames, kMaxStackFrames);
    char** symbols = backtrace_symbols(frames, size);
    if (!symbols) {
        return stack_trace;
    }

    for (int i = 0; i < size; ++i) {
        stack_trace.emplace_back(symbols[i]);
    }

    free(symbols);
    return stack_trace;
}

void ErrorHandler::writeToLog(const ErrorInfo& error) const {
    if (error.severity < minimum_severity_) {
        return;
    }

    std::map<std::string, std::string> context = error.context;
    context["error_id"] = error.id;

    Logger::log(toLogLevel(error.severity),
                toLogCategory(error.category),
                error.message,
                error.file,
                error.line,
                error.function,
                context);
}

void ErrorHandler::notifyCallbacks(const ErrorInfo& error) {
    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [handle, callback] : callbacks_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            // Don't let callback errors propagate
            std::cerr << "Error in error callback: " << e.what() << std::endl;
        }
    }
}

std::string ErrorHandler::getSeverityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::DEBUG: return "DEBUG";
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ErrorHandler::getCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NETWORKING: return "NETWORKING";
        case ErrorCategory::TRANSPORT: return "TRANSPORT";
        case ErrorCategory::AGENT: return "AGENT";
        case ErrorCategory::TOPOLOGY: return "TOPOLOGY";
        case ErrorCategory::EVENTS: return "EVENTS";
        case ErrorCategory::CONFIGURATION: return "CONFIG";
        case ErrorCategory::CLI: return "CLI";
        case ErrorCategory::VALIDATION: return "VALIDATION";
        case ErrorCategory::SYSTEM: return "SYSTEM";
        default: return "UNKNOWN";
    }
}

} // namespace utils
} // namespace swarmnet
