#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

struct CommandResult
{
    bool launched = false; // false when the program could not be found or started
    int exit_code = -1;
    std::string output;    // captured stdout (and stderr when merged)

    bool succeeded() const { return launched && exit_code == 0; }
};

// Cross-platform utilities for process management
class ProcessUtils
{
public:
    // Get the absolute path to the current executable
    static std::filesystem::path GetExecutablePath();

    // Locate an executable on PATH. Returns an empty path when not found.
    static std::filesystem::path FindInPath(const std::string& program);

    // Quote one argument for a Windows command line so CommandLineToArgvW
    // reads it back unchanged: embedded quotes and the backslashes before
    // them are escaped, and trailing backslashes are doubled.
    static std::string QuoteWindowsArgument(const std::string& arg);

    // Run a program (looked up on PATH) and wait for it, capturing stdout.
    // With mergeStderr the child's stderr is captured too; otherwise it is discarded.
    static CommandResult Run(const std::vector<std::string>& args, bool mergeStderr = false);
};

} // namespace utils
