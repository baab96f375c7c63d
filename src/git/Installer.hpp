#pragma once

#include "GitConfig.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace git
{

constexpr const char* kIpynbFilterLine = "*.ipynb filter=nbstripout";
constexpr const char* kZeppelinFilterLine = "*.zpln filter=nbstripout";
constexpr const char* kIpynbDiffLine = "*.ipynb diff=ipynb";

/// Text to append to an attributes file whose current content is `existing`
/// so that the filter and diff entries are present. Empty when the ipynb
/// filter and diff entries already exist. Starts with a newline when the
/// existing content does not end with one.
std::string missingAttributes(const std::string& existing);

/// `content` without the lines that start with "*.ipynb filter",
/// "*.zpln filter" or "*.ipynb diff".
std::string removeFilterAttributes(const std::string& content);

/// Expands a leading "~" to the home directory.
std::filesystem::path expandUser(const std::string& path);

// Installs, removes and inspects the nbstripout git filter.
// Each operation returns the process exit code (0 success, 1 failure) and
// writes user-facing failures through ErrorReporter.
class Installer
{
public:
    explicit Installer(ConfigScope scope, std::ostream& out);

    int install(const std::optional<std::string>& attrfile);
    int uninstall(const std::optional<std::string>& attrfile);
    int status(bool verbose);

    // Command git runs as the clean filter: the quoted path of this executable.
    // Empty when the executable cannot be located.
    static std::string filterCommand();
    static std::string filterCommand(const std::filesystem::path& executable);

private:
    enum class Failure
    {
        None,
        GitMissing,
        CommandFailed
    };

    struct AttributesLocation
    {
        Failure failure = Failure::None;
        std::filesystem::path path;
    };

    AttributesLocation resolveAttributesFile(const std::optional<std::string>& attrfile) const;
    std::optional<std::filesystem::path> systemConfigDirectory() const;

    GitConfig config_;
    std::ostream& out_;
};

} // namespace git
