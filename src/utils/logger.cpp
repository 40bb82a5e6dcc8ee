/**
 * @file logger.cpp
 * @brief Logging system implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace swarmnet {
namespace utils {

namespace {

constexpr size_t kMaxRecentEntries = 1000;

std::string formatTimestamp(const std::chrono::system_clock::time_point& timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "."
       << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

} // namespace

std::unique_ptr<Logger> Logger::instance_ = nullptr;
std::mutex Logger::instance_mutex_;

void Logger::initialize(LogLevel level, const std::string& log_file, bool enable_async) {
    auto& instance = getInstance();
    {
        std::lock_guard<std::mutex> lock(instance.mutex_);
        instance.config_.min_level = level;
    }

    if (!log_file.empty()) {
        setLogFile(log_file);
    }

    if (enable_async && !instance.config_.async_enabled) {
        instance.startAsyncWorker();
    }

    SWARMNET_LOG_INFO(GENERAL, "Logging system initialized at level " + getLevelName(level));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (instance_) {
        instance_->stopAsyncWorker();

        std::lock_guard<std::mutex> write_lock(instance_->write_mutex_);
        if (instance_->log_stream_.is_open()) {
            instance_->log_stream_.close();
        }
    }
}

void Logger::log(LogLevel level,
                 LogCategory category,
                 const std::string& message,
                 const std::string& file,
                 int line,
                 const std::string& function,
                 const std::map<std::string, std::string>& context) {
    auto& instance = getInstance();

    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(instance.mutex_);
        if (level < instance.config_.min_level || !instance.config_.category_enabled[category]) {
            return;
        }
    }

    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.function = function;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = instance.getThreadId();
    entry.context = context;

    instance.record(entry);

    if (instance.config_.async_enabled) {
        std::lock_guard<std::mutex> lock(instance.mutex_);
        instance.log_queue_.push(entry);
        instance.log_condition_.notify_one();
    } else {
        instance.writeLog(entry);
    }
}

void Logger::setLevel(LogLevel level) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.config_.min_level = level;
}

LogLevel Logger::getLevel() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    return instance.config_.min_level;
}

void Logger::setFormatter(std::unique_ptr<LogFormatter> formatter) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.write_mutex_);
    instance.formatter_ = std::move(formatter);
}

void Logger::setCategoryEnabled(LogCategory category, bool enabled) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.config_.category_enabled[category] = enabled;
}

void Logger::setConsoleEnabled(bool enabled) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.config_.console_enabled = enabled;
}

void Logger::setLogFile(const std::string& file_path) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> write_lock(instance.write_mutex_);

    if (instance.log_stream_.is_open()) {
        instance.log_stream_.close();
    }

    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.config_.log_file = file_path;
    instance.config_.file_enabled = false;

    if (!file_path.empty()) {
        instance.log_stream_.open(file_path, std::ios::app);
        instance.config_.file_enabled = instance.log_stream_.is_open();
        if (!instance.config_.file_enabled) {
            std::cerr << "Unable to open log file: " << file_path << std::endl;
        }
    }
}

void Logger::flush() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.write_mutex_);
    if (instance.log_stream_.is_open()) {
        instance.log_stream_.flush();
    }
    std::cout.flush();
}

std::map<std::string, size_t> Logger::getStatistics() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    return instance.statistics_;
}

void Logger::clearStatistics() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);
    instance.statistics_.clear();
}

std::vector<LogEntry> Logger::getRecentEntries(size_t count) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex_);

    size_t start = (instance.recent_entries_.size() > count) ?
                   instance.recent_entries_.size() - count : 0;

    return std::vector<LogEntry>(instance.recent_entries_.begin() + start,
                                 instance.recent_entries_.end());
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

Logger::Logger() : stop_async_(false) {
    formatter_ = std::make_unique<DefaultFormatter>();

    config_.min_level = LogLevel::INFO;
    config_.console_enabled = true;
    config_.file_enabled = false;
    config_.async_enabled = false;

    for (auto category : {LogCategory::GENERAL, LogCategory::NETWORKING, LogCategory::TRANSPORT,
                          LogCategory::AGENT, LogCategory::TOPOLOGY, LogCategory::EVENTS,
                          LogCategory::CONFIGURATION, LogCategory::CLI, LogCategory::PERFORMANCE}) {
        config_.category_enabled[category] = true;
    }
}

Logger::~Logger() {
    stopAsyncWorker();
}

Logger& Logger::getInstance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_unique<Logger>();
    }
    return *instance_;
}

void Logger::writeLog(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::string formatted_message = formatter_->format(entry);

    bool console_enabled;
    bool file_enabled;
    {
        std::lock_guard<std::mutex> config_lock(mutex_);
        console_enabled = config_.console_enabled;
        file_enabled = config_.file_enabled;
    }

    if (console_enabled) {
        writeToConsole(formatted_message, entry.level);
    }

    if (file_enabled) {
        writeToFile(formatted_message);
    }
}

void Logger::writeToConsole(const std::string& formatted, LogLevel level) {
    if (level >= LogLevel::ERROR) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::writeToFile(const std::string& formatted) {
    if (log_stream_.is_open()) {
        log_stream_ << formatted << std::endl;
    }
}

void Logger::startAsyncWorker() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_async_ = false;
    config_.async_enabled = true;
    async_thread_ = std::thread([this]() { asyncWorker(); });
}

void Logger::stopAsyncWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.async_enabled) {
            return;
        }
        stop_async_ = true;
    }
    log_condition_.notify_all();

    if (async_thread_.joinable()) {
        async_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_.async_enabled = false;
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        log_condition_.wait(lock, [this] { return !log_queue_.empty() || stop_async_; });

        // Drain before honouring the stop flag so shutdown loses nothing.
        while (!log_queue_.empty()) {
            LogEntry entry = std::move(log_queue_.front());
            log_queue_.pop();
            lock.unlock();
            writeLog(entry);
            lock.lock();
        }

        if (stop_async_) {
            break;
        }
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::getCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::GENERAL: return "GENERAL";
        case LogCategory::NETWORKING: return "NET";
        case LogCategory::TRANSPORT: return "TRANSPORT";
        case LogCategory::AGENT: return "AGENT";
        case LogCategory::TOPOLOGY: return "TOPOLOGY";
        case LogCategory::EVENTS: return "EVENTS";
        case LogCategory::CONFIGURATION: return "CONFIG";
        case LogCategory::CLI: return "CLI";
        case LogCategory::PERFORMANCE: return "PERF";
        default: return "UNKNOWN";
    }
}

std::string Logger::getThreadId() const {
    std::stringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

void Logger::record(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = getLevelName(entry.level) + "_" + getCategoryName(entry.category);
    statistics_[key]++;

    recent_entries_.push_back(entry);
    if (recent_entries_.size() > kMaxRecentEntries) {
        recent_entries_.erase(recent_entries_.begin());
    }
}

std::string DefaultFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << Logger::getLevelName(entry.level) << "] ";
    ss << "[" << Logger::getCategoryName(entry.category) << "] ";
    ss << "[" << entry.thread_id << "] ";
    ss << entry.message;

    if (!entry.context.empty()) {
        ss << " [";
        bool first = true;
        for (const auto& pair : entry.context) {
            if (!first) ss << ", ";
            ss << pair.first << "=" << pair.second;
            first = false;
        }
        ss << "]";
    }

    return ss.str();
}

std::string JsonFormatter::format(const LogEntry& entry) {
    nlohmann::json object;
    object["timestamp"] = formatTimestamp(entry.timestamp);
    object["level"] = Logger::getLevelName(entry.level);
    object["category"] = Logger::getCategoryName(entry.category);
    object["thread_id"] = entry.thread_id;
    object["message"] = entry.message;

    if (!entry.file.empty()) {
        object["file"] = entry.file;
        object["line"] = entry.line;
        if (!entry.function.empty()) {
            object["function"] = entry.function;
        }
    }

    if (!entry.context.empty()) {
        object["context"] = entry.context;
    }

    // Message text can carry peer-supplied bytes that are not valid UTF-8
    return object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace utils
} // namespace swarmnet
