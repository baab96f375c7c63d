#include "ErrorReporter.hpp"
#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
ErrorReport ErrorReporter::s_last_report;
std::size_t ErrorReporter::s_error_count = 0;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << user_message;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << user_message;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << user_message;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << user_message;
        break;
    }

    if (!technical_details.empty())
    {
        PLOG_DEBUG << "[" << CategoryToString(category) << "] Details: " << technical_details;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_last_report = ErrorReport(category, severity, user_message, technical_details);
    if (severity == ErrorSeverity::Error || severity == ErrorSeverity::Fatal)
        ++s_error_count;
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

std::size_t ErrorReporter::ErrorCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_count;
}

ErrorReport ErrorReporter::GetLastReport()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_last_report;
}

void ErrorReporter::Reset()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_last_report = ErrorReport();
    s_error_count = 0;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Notebook:
        return "Notebook";
    case ErrorCategory::Git:
        return "Git";
    case ErrorCategory::FileIO:
        return "File I/O";
    case ErrorCategory::Unknown:
        return "Unknown";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    default:
        return "Unknown";
    }
}

} // namespace utils
