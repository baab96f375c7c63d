#pragma once

#include "Settings.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <toml++/toml.h>

namespace config
{

// Reads the [tool.nbstripout] table of a pyproject.toml.
//
//   [tool.nbstripout]
//   keep_count = true
//   extra_keys = ["metadata.celltoolbar", "cell.metadata.heading_collapsed"]
//   drop_tagged_cells = "remove hide"
//   max_size = "1k"
//
// Unknown keys and values of the wrong type are reported as warnings and skipped.
class ProjectConfig
{
public:
    static constexpr const char* kFileName = "pyproject.toml";

    // Nearest pyproject.toml in start_dir or one of its parents
    static std::optional<std::filesystem::path> find(const std::filesystem::path& start_dir);

    // A missing file is not an error and leaves outLayer empty
    bool loadFile(const std::filesystem::path& path, SettingsLayer& outLayer);
    bool loadString(const std::string& content, SettingsLayer& outLayer);

    const std::string& lastError() const { return last_error_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    bool loadTable(const toml::table& root, SettingsLayer& outLayer);
    void warn(const std::string& message);

    std::string source_name_ = kFileName;
    std::string last_error_;
    std::vector<std::string> warnings_;
};

} // namespace config
