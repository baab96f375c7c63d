#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace utils {

enum class ErrorCategory
{
    Configuration, // TOML parsing, git config, invalid options
    Notebook,      // malformed notebooks, metadata contradictions
    Git,           // git filter installation and status
    FileIO,        // reading or writing notebooks
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed
    Fatal    // Critical error, process should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Printed as-is on stderr
    std::string technical_details; // Logged at debug level only

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Reports problems through plog
 *
 * The user message goes to the log at the matching severity, so the console
 * appender prints it on stderr. Technical details are only visible with
 * --verbose or in the log file.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::FileIO,
 *                              "Could not strip 'a.ipynb': file not found");
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

    /**
     * @brief Number of Error or Fatal reports since start (or last Reset)
     */
    static std::size_t ErrorCount();

    /**
     * @brief Most recent report, default-constructed when none
     */
    static ErrorReport GetLastReport();

    static void Reset();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

private:
    static std::mutex s_mutex;
    static ErrorReport s_last_report;
    static std::size_t s_error_count;
};

} // namespace utils
