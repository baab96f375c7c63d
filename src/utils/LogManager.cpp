#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../log/ConsoleFormatter.hpp"

#include <filesystem>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(plog::Severity level)
{
    if (s_initialized)
    {
        SetLevel(level);
        return true;
    }

    auto console_appender = std::make_unique<plog::ConsoleAppender<ConsoleFormatter>>(plog::streamStdErr);
    plog::init(level, console_appender.get());
    s_appenders.push_back(std::move(console_appender));

    s_initialized = true;
    return true;
}

bool LogManager::RegisterFileLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        const std::filesystem::path path(config.filepath);
        if (path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
            {
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unable to prepare log directory",
                                             ec.message());
            }
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        if (auto logger = plog::get())
        {
            logger->addAppender(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
        }
        PLOG_DEBUG << "Registered log file " << config.filepath << " for " << config.name;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

void LogManager::SetLevel(plog::Severity level)
{
    if (auto logger = plog::get())
        logger->setMaxSeverity(level);
}

plog::Severity LogManager::GetLevel()
{
    if (auto logger = plog::get())
        return logger->getMaxSeverity();
    return plog::none;
}

plog::Severity LogManager::SeverityFromInt(std::int64_t value, plog::Severity fallback)
{
    if (value >= plog::none && value <= plog::verbose)
        return static_cast<plog::Severity>(value);
    return fallback;
}

bool LogManager::IsInitialized() { return s_initialized; }

} // namespace utils
