#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Initialization, // SDL, ImGui, logger setup
    Configuration,  // TOML parsing, out-of-range spring parameters
    Scheduling,     // frame callbacks
    Callback,       // user completion callbacks
    Numeric,        // diverging or non-finite motion
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded behavior, but continues
    Error,   // Operation failed, but app can continue
    Fatal    // Critical error, app should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message for users
    std::string technical_details; // Values and context for logs
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects errors from the spring core and the host and queues them for UI
 * display. Every report is also logged through plog.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Spring parameters are out of range",
 *                                "duration=0");
 *
 *   // In main loop:
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *       // Show in UI...
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-friendly message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a fatal error (logs and queues for UI)
     */
    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a regular error
     */
    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a warning
     */
    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Get the most recent pending error, or an empty report
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
