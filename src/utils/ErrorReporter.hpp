#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace fxprobe::utils
{

enum class ErrorCategory
{
    Initialization, // Logging setup
    Configuration,  // TOML parsing, invalid config
    Discovery,      // Install scanning and resolution
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but app can continue
    Fatal    // Critical error, app should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Details for logs/bug reports
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Every report is logged through plog and queued until the front end
 * drains it.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Ignoring invalid configuration value 'logging.level'",
 *                                "File: fxprobe.toml");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << report.user_message << "\n";
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

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace fxprobe::utils
