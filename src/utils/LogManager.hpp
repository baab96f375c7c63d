#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the appenders of the default plog instance.
// The console appender writes to stderr since stdout carries notebook data.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
    };

    static bool Initialize(plog::Severity level = plog::warning);

    // Adds a rolling file appender to the default logger
    static bool RegisterFileLogger(const LoggerConfig& config);

    static void SetLevel(plog::Severity level);
    static plog::Severity GetLevel();

    // Maps 0-6 (none..verbose) to a plog severity, or returns fallback
    static plog::Severity SeverityFromInt(std::int64_t value, plog::Severity fallback);

    static bool IsInitialized();

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
