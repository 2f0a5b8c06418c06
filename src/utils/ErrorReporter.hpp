#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging setup, command line
    Configuration,  // TOML parsing, invalid config values
    Processing,     // text operations rejecting their settings or input
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // defaults were used, the command still runs
    Error,   // the command could not run
    Fatal    // nothing was run
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // what went wrong, in one line
    std::string technical_details; // exception text, parse position, file name
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Collects problems met while setting up and running a command
 *
 * Each report goes to the main plog logger right away and is queued until the
 * front end drains it with GetPendingErrors() and prints it to stderr.
 *
 *   ErrorReporter::ReportError(ErrorCategory::Processing, "Cannot run abbreviate",
 *                              "upper value is less than lower value");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    // Takes every queued report, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // "Warning [Configuration]: message (details)"
    static std::string FormatReport(const ErrorReport& report);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
