#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ProjectConfig.hpp"
#include "git/GitConfig.hpp"
#include "git/Installer.hpp"
#include "io/NotebookIO.hpp"
#include "strip/NotebookStripper.hpp"
#include "strip/ZeppelinStripper.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace
{

using utils::ErrorCategory;
using utils::ErrorReporter;

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nbstripout::WarningContext makeWarningContext()
{
    return nbstripout::WarningContext([](const std::string& message) { PLOG_WARNING << message; });
}

} // namespace

Application::Application(int argc, char** argv)
    : in_(std::cin)
    , out_(std::cout)
    , err_(std::cerr)
{
    if (argc > 0 && argv[0])
        program_name_ = fs::path(argv[0]).filename().string();
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::Application(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err)
    : args_(std::move(args))
    , in_(in)
    , out_(out)
    , err_(err)
{
}

int Application::run()
{
    std::string error;
    if (!cli::parseCommandLine(args_, options_, error))
    {
        cli::printUsage(err_, program_name_);
        err_ << program_name_ << ": error: " << error << "\n";
        return 2;
    }

    if (options_.task == cli::Task::Help)
    {
        cli::printHelp(out_, program_name_);
        return 0;
    }

    initializeLogging();

    switch (options_.task)
    {
    case cli::Task::Install:
    case cli::Task::Uninstall:
    case cli::Task::IsInstalled:
    case cli::Task::Status:
        return runInstallerTask();
    case cli::Task::Version:
        out_ << NBSTRIPOUT_VERSION_STRING << "\n";
        return 0;
    default:
        break;
    }

    if (!loadSettings())
        return 1;
    applyLoggingSettings();

    if (!options_.files.empty())
        return processFiles();
    return processStream();
}

void Application::initializeLogging()
{
    utils::LogManager::Initialize(options_.verbose ? plog::debug : plog::warning);
    ErrorReporter::Reset();
}

bool Application::loadSettings()
{
    settings_ = config::defaultSettings();

    const auto git_keys = git::GitConfig(options_.scope).readExtraKeys();
    settings_.strip.extra_keys.insert(settings_.strip.extra_keys.end(), git_keys.begin(), git_keys.end());

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec)
    {
        if (auto project_file = config::ProjectConfig::find(cwd))
        {
            config::ProjectConfig project;
            config::SettingsLayer layer;
            if (!project.loadFile(*project_file, layer))
            {
                ErrorReporter::ReportError(ErrorCategory::Configuration,
                                           "Could not read " + project_file->string() + ": " + project.lastError());
                return false;
            }
            PLOG_DEBUG << "Loaded settings from " << project_file->string();
            config::applyLayer(settings_, layer);
        }
    }

    config::applyLayer(settings_, options_.overrides);

    PLOG_DEBUG << "Mode " << config::modeToString(settings_.mode) << ", " << settings_.strip.extra_keys.size()
               << " extra keys, max size " << settings_.strip.max_size;
    return true;
}

void Application::applyLoggingSettings()
{
    if (!options_.verbose && settings_.log_level)
        utils::LogManager::SetLevel(utils::LogManager::SeverityFromInt(*settings_.log_level, plog::warning));

    if (!settings_.log_file.empty())
    {
        utils::LogManager::LoggerConfig file_config;
        file_config.name = "nbstripout";
        file_config.filepath = settings_.log_file;
        if (!utils::LogManager::RegisterFileLogger(file_config))
            PLOG_DEBUG << "Continuing without log file " << settings_.log_file;
    }
}

int Application::runInstallerTask()
{
    git::Installer installer(options_.scope, out_);
    switch (options_.task)
    {
    case cli::Task::Install:
        return installer.install(options_.attributes);
    case cli::Task::Uninstall:
        return installer.uninstall(options_.attributes);
    case cli::Task::IsInstalled:
        return installer.status(false);
    default:
        return installer.status(true);
    }
}

int Application::processFiles()
{
    for (const auto& filename : options_.files)
    {
        if (!(options_.force || endsWith(filename, ".ipynb") || endsWith(filename, ".zpln")))
        {
            PLOG_DEBUG << "Skipping " << filename;
            continue;
        }

        const int rc = processFile(filename);
        if (rc != 0)
            return rc;
    }
    return 0;
}

int Application::processFile(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
    {
        std::error_code ec;
        if (!fs::exists(filename, ec))
            ErrorReporter::ReportError(ErrorCategory::FileIO, "Could not strip '" + filename + "': file not found");
        else
            ErrorReporter::ReportError(ErrorCategory::FileIO, "Could not strip '" + filename + "': cannot open file");
        return 1;
    }

    if (settings_.mode == config::NotebookMode::Zeppelin || endsWith(filename, ".zpln"))
        return processZeppelinFile(filename, file);

    nlohmann::json notebook;
    std::string error;
    if (!nbstripout::NotebookIO::readJupyter(file, notebook, error))
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "'" + filename + "' is not a valid notebook", error);
        return 1;
    }
    file.close();

    const auto warnings = makeWarningContext();
    try
    {
        auto result = nbstripout::stripCellFormat(std::move(notebook), settings_.strip, &warnings);
        if (!result)
        {
            ErrorReporter::ReportError(ErrorCategory::Notebook,
                                       "Could not strip '" + filename + "': " + result.error->message());
            return 1;
        }

        if (options_.task == cli::Task::DryRun)
        {
            err_ << "Dry run: would have stripped " << filename << "\n";
            return 0;
        }

        if (options_.textconv)
        {
            nbstripout::NotebookIO::writeJupyter(result.document, out_);
            out_.flush();
            return 0;
        }

        if (!nbstripout::NotebookIO::writeJupyterFile(filename, result.document, error))
        {
            ErrorReporter::ReportError(ErrorCategory::FileIO, "Could not strip '" + filename + "': " + error);
            return 1;
        }
        PLOG_DEBUG << "Stripped " << filename;
        return 0;
    }
    catch (const nbstripout::MalformedNotebookError& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "Could not strip '" + filename + "': " + e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "Could not strip '" + filename + "': " + e.what());
    }
    return 1;
}

int Application::processZeppelinFile(const std::string& filename, std::istream& in)
{
    if (options_.task == cli::Task::DryRun)
    {
        err_ << "Dry run: would have stripped " << filename << "\n";
        return 0;
    }

    nlohmann::ordered_json note;
    std::string error;
    if (!nbstripout::NotebookIO::readZeppelin(in, note, error))
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "Could not strip '" + filename + "': " + error);
        return 1;
    }

    try
    {
        note = nbstripout::stripParagraphFormat(std::move(note));
    }
    catch (const nbstripout::MalformedNotebookError& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "Could not strip '" + filename + "': " + e.what());
        return 1;
    }

    if (!nbstripout::NotebookIO::writeZeppelinFile(filename, note, error))
    {
        ErrorReporter::ReportError(ErrorCategory::FileIO, "Could not strip '" + filename + "': " + error);
        return 1;
    }
    return 0;
}

int Application::processStream()
{
    std::string error;

    if (settings_.mode == config::NotebookMode::Zeppelin)
    {
        if (options_.task == cli::Task::DryRun)
        {
            err_ << "Dry run: would have stripped input from stdin\n";
            return 0;
        }

        nlohmann::ordered_json note;
        if (!nbstripout::NotebookIO::readZeppelin(in_, note, error))
        {
            ErrorReporter::ReportError(ErrorCategory::Notebook, "No valid notebook detected", error);
            return 1;
        }
        try
        {
            nbstripout::NotebookIO::writeZeppelin(nbstripout::stripParagraphFormat(std::move(note)), out_, true);
        }
        catch (const nbstripout::MalformedNotebookError& e)
        {
            ErrorReporter::ReportError(ErrorCategory::Notebook, std::string("Could not strip input from stdin: ") + e.what());
            return 1;
        }
        out_.flush();
        return 0;
    }

    nlohmann::json notebook;
    if (!nbstripout::NotebookIO::readJupyter(in_, notebook, error))
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, "No valid notebook detected", error);
        return 1;
    }

    const auto warnings = makeWarningContext();
    try
    {
        auto result = nbstripout::stripCellFormat(std::move(notebook), settings_.strip, &warnings);
        if (!result)
        {
            ErrorReporter::ReportError(ErrorCategory::Notebook,
                                       "Could not strip input from stdin: " + result.error->message());
            return 1;
        }

        if (options_.task == cli::Task::DryRun)
            out_ << "Dry run: would have stripped input from stdin\n";
        else
            nbstripout::NotebookIO::writeJupyter(result.document, out_);
        out_.flush();
        return 0;
    }
    catch (const nbstripout::MalformedNotebookError& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, std::string("Could not strip input from stdin: ") + e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Notebook, std::string("Could not strip input from stdin: ") + e.what());
    }
    return 1;
}
