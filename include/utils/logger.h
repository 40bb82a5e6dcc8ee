/**
 * @file logger.h
 * @brief Logging system for the SwarmNet agent network
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <fstream>
#include <chrono>
#include <atomic>
#include <thread>
#include <queue>
#include <condition_variable>
#include <map>
#include <vector>

namespace swarmnet {
namespace utils {

/**
 * @brief Severity of a log entry, ordered from most to least verbose
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL,
    FATAL
};

/**
 * @brief Subsystem a log entry belongs to
 */
enum class LogCategory {
    GENERAL,
    NETWORKING,   ///< Sockets and links
    TRANSPORT,    ///< Message dispatch, heartbeats, discovery
    AGENT,        ///< Agent wrapper, collaboration and delegation
    TOPOLOGY,     ///< Registry, graph and seed selection
    EVENTS,
    CONFIGURATION,
    CLI,
    PERFORMANCE   ///< Metrics and health checks
};

/**
 * @brief One recorded log line
 */
struct LogEntry {
    LogLevel level;
    LogCategory category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::string thread_id;
    std::map<std::string, std::string> context;  ///< Key/value pairs such as peer or message ids

    LogEntry() : level(LogLevel::INFO), category(LogCategory::GENERAL), line(0) {}
};

/**
 * @brief Turns a log entry into the text written to the sinks
 */
class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/// "[time] [LEVEL] [CATEGORY] [thread] message [k=v, ...]"
class DefaultFormatter : public LogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/// One JSON object per line, for log shippers
class JsonFormatter : public LogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Process-wide logger shared by transports, agents and the topology manager
 *
 * Entries below the minimum level or in a disabled category are dropped
 * before formatting. Accepted entries are counted per "LEVEL_CATEGORY",
 * kept in a bounded ring for inspection, and written to the console
 * (errors to stderr) and optionally a file. With the async worker enabled
 * writes happen on a background thread; shutdown() drains the queue.
 */
class Logger {
public:
    /**
     * @brief Set the level, open the log file and optionally start the writer thread
     * @param level Minimum level
     * @param log_file File to append to, empty for console only
     * @param enable_async Write from a background thread
     */
    static void initialize(LogLevel level = LogLevel::INFO,
                           const std::string& log_file = "",
                           bool enable_async = false);

    static void shutdown();

    static void log(LogLevel level,
                    LogCategory category,
                    const std::string& message,
                    const std::string& file = "",
                    int line = 0,
                    const std::string& function = "",
                    const std::map<std::string, std::string>& context = {});

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void setFormatter(std::unique_ptr<LogFormatter> formatter);
    static void setCategoryEnabled(LogCategory category, bool enabled);
    static void setConsoleEnabled(bool enabled);

    /**
     * @brief Switch file output to a new path
     *
     * An empty path, or one that cannot be opened, disables file output.
     */
    static void setLogFile(const std::string& file_path);

    static void flush();

    static std::map<std::string, size_t> getStatistics();
    static void clearStatistics();

    /// Newest @p count entries, oldest first
    static std::vector<LogEntry> getRecentEntries(size_t count = 100);

    /// Case-insensitive; accepts "warn" and "warning"
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    static std::string getLevelName(LogLevel level);
    static std::string getCategoryName(LogCategory category);

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    struct LogConfig {
        LogLevel min_level;
        std::string log_file;
        bool console_enabled;
        bool file_enabled;
        bool async_enabled;
        std::map<LogCategory, bool> category_enabled;
    };

    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;

    std::mutex mutex_;        // config, queue, statistics, ring
    std::mutex write_mutex_;  // formatter and sinks
    LogConfig config_;
    std::unique_ptr<LogFormatter> formatter_;
    std::ofstream log_stream_;

    std::thread async_thread_;
    std::atomic<bool> stop_async_;
    std::queue<LogEntry> log_queue_;
    std::condition_variable log_condition_;

    std::map<std::string, size_t> statistics_;
    std::vector<LogEntry> recent_entries_;

    static Logger& getInstance();

    void writeLog(const LogEntry& entry);
    void writeToConsole(const std::string& formatted, LogLevel level);
    void writeToFile(const std::string& formatted);
    void startAsyncWorker();
    void stopAsyncWorker();
    void asyncWorker();
    std::string getThreadId() const;
    void record(const LogEntry& entry);
};

#define SWARMNET_LOG_AT(level, category, message) \
    ::swarmnet::utils::Logger::log(::swarmnet::utils::LogLevel::level, \
                                   ::swarmnet::utils::LogCategory::category, \
                                   message, __FILE__, __LINE__, __FUNCTION__)

#define SWARMNET_LOG_TRACE(category, message) SWARMNET_LOG_AT(TRACE, category, message)
#define SWARMNET_LOG_DEBUG(category, message) SWARMNET_LOG_AT(DEBUG, category, message)
#define SWARMNET_LOG_INFO(category, message) SWARMNET_LOG_AT(INFO, category, message)
#define SWARMNET_LOG_WARNING(category, message) SWARMNET_LOG_AT(WARNING, category, message)
#define SWARMNET_LOG_ERROR(category, message) SWARMNET_LOG_AT(ERROR, category, message)
#define SWARMNET_LOG_CRITICAL(category, message) SWARMNET_LOG_AT(CRITICAL, category, message)

} // namespace utils
} // namespace swarmnet
