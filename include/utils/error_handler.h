/**
 * @file error_handler.h
 * @brief Error reporting and tracking for SwarmNet
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <chrono>
#include <map>

namespace swarmnet {
namespace utils {

enum class ErrorSeverity {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL,
    FATAL
};

/**
 * @brief Subsystem an error is attributed to
 *
 * Mirrors LogCategory, plus VALIDATION for malformed input and SYSTEM for
 * anything else.
 */
enum class ErrorCategory {
    NETWORKING,
    TRANSPORT,
    AGENT,
    TOPOLOGY,
    EVENTS,
    CONFIGURATION,
    CLI,
    VALIDATION,
    SYSTEM
};

/**
 * @brief A reported error as kept in the history and passed to callbacks
 */
struct ErrorInfo {
    std::string id;                     ///< "err_<hex millis>_<sequence>"
    ErrorSeverity severity;
    ErrorCategory category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> context;
    std::vector<std::string> stack_trace;  ///< Filled for ERROR and above when enabled
    std::string thread_id;

    ErrorInfo() : severity(ErrorSeverity::ERROR), category(ErrorCategory::SYSTEM), line(0) {}
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * @brief Process-wide error reporting
 *
 * Every report is recorded and counted, and passed to registered
 * callbacks. Reports at or above the minimum severity are also logged
 * with their error id in the log context. A callback that throws is
 * reported on stderr and does not stop the others.
 */
class ErrorHandler {
public:
    /**
     * @brief Record, log and dispatch an error
     * @return The generated error id
     */
    static std::string reportError(ErrorSeverity severity,
                                   ErrorCategory category,
                                   const std::string& message,
                                   const std::string& file = "",
                                   int line = 0,
                                   const std::string& function = "",
                                   const std::map<std::string, std::string>& context = {});

    /// @return Handle for unregisterCallback
    static size_t registerCallback(ErrorCallback callback);
    static void unregisterCallback(size_t handle);

    /// Counts keyed by "SEVERITY_CATEGORY"
    static std::map<std::string, size_t> getErrorStatistics();

    /// Reports in @p category at or above @p min_severity since the last clear
    static size_t countErrors(ErrorCategory category, ErrorSeverity min_severity = ErrorSeverity::WARNING);

    static std::vector<ErrorInfo> getRecentErrors(size_t count = 100);
    static void clearErrorHistory();
    static void setMinimumSeverity(ErrorSeverity severity);
    static void setStackTraceEnabled(bool enabled);

    static std::string getSeverityName(ErrorSeverity severity);
    static std::string getCategoryName(ErrorCategory category);

    ErrorHandler();
    ~ErrorHandler() = default;

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

private:
    static std::unique_ptr<ErrorHandler> instance_;
    static std::mutex instance_mutex_;

    std::mutex mutex_;
    std::vector<ErrorInfo> error_history_;
    std::map<size_t, ErrorCallback> callbacks_;
    size_t next_callback_handle_;
    std::map<std::string, size_t> error_statistics_;
    std::map<std::pair<ErrorCategory, ErrorSeverity>, size_t> category_counts_;

    bool stack_trace_enabled_;
    ErrorSeverity minimum_severity_;
    uint64_t sequence_;

    static ErrorHandler& getInstance();

    std::string generateErrorId();
    std::vector<std::string> collectStackTrace() const;
    void writeToLog(const ErrorInfo& error) const;
    void notifyCallbacks(const ErrorInfo& error);
};

#define SWARMNET_REPORT_AT(severity, category, message) \
    ::swarmnet::utils::ErrorHandler::reportError(::swarmnet::utils::ErrorSeverity::severity, \
                                                 ::swarmnet::utils::ErrorCategory::category, \
                                                 message, __FILE__, __LINE__, __FUNCTION__)

#define SWARMNET_WARNING(category, message) SWARMNET_REPORT_AT(WARNING, category, message)
#define SWARMNET_ERROR(category, message) SWARMNET_REPORT_AT(ERROR, category, message)
#define SWARMNET_CRITICAL(category, message) SWARMNET_REPORT_AT(CRITICAL, category, message)

} // namespace utils
} // namespace swarmnet
