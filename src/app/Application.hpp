#pragma once

#include "../cli/CommandLine.hpp"
#include "../config/Settings.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Command-line front end: strips the given files in place, or stdin to
// stdout, or manages the git filter installation.
class Application
{
public:
    Application(int argc, char** argv);
    Application(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err);

    // Process exit code: 0 success, 1 failure, 2 usage error
    int run();

private:
    void initializeLogging();
    bool loadSettings();
    void applyLoggingSettings();

    int runInstallerTask();
    int processFiles();
    int processFile(const std::string& filename);
    int processZeppelinFile(const std::string& filename, std::istream& in);
    int processStream();

    std::string program_name_ = "nbstripout";
    std::vector<std::string> args_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    cli::CommandLineOptions options_;
    config::Settings settings_;
};
