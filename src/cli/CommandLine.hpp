#pragma once

#include "../config/Settings.hpp"
#include "../git/GitConfig.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cli
{

enum class Task
{
    Strip,
    DryRun,
    Install,
    Uninstall,
    IsInstalled,
    Status,
    Version,
    Help
};

struct CommandLineOptions
{
    Task task = Task::Strip;
    git::ConfigScope scope = git::ConfigScope::Local;
    std::optional<std::string> attributes;
    bool force = false;
    bool textconv = false;
    bool verbose = false;
    config::SettingsLayer overrides; // applied on top of git config and pyproject.toml
    std::vector<std::string> files;
};

// Parses argv without the program name. Returns false with outError set on a
// usage error; the caller prints usage and exits with 2.
bool parseCommandLine(const std::vector<std::string>& rawArgs, CommandLineOptions& outOptions, std::string& outError);

void printUsage(std::ostream& out, const std::string& program_name);
void printHelp(std::ostream& out, const std::string& program_name);

} // namespace cli
