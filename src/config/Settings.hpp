#pragma once

#include "../strip/StripConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace config
{

enum class NotebookMode
{
    Jupyter,
    Zeppelin
};

// One source of settings (project file, command line). Unset fields defer
// to the layers applied before it.
struct SettingsLayer
{
    std::optional<bool> keep_output;
    std::optional<bool> keep_count;
    std::vector<std::string> extra_keys; // appended to earlier layers
    std::optional<bool> drop_empty_cells;
    std::optional<std::vector<std::string>> drop_tagged_cells; // replaces earlier layers
    std::optional<bool> strip_init_cells;
    std::optional<std::uint64_t> max_size;
    std::optional<NotebookMode> mode;
    std::optional<std::int64_t> log_level;
    std::optional<std::string> log_file;
};

// Effective settings for one invocation.
struct Settings
{
    nbstripout::StripConfig strip;
    NotebookMode mode = NotebookMode::Jupyter;
    std::optional<std::int64_t> log_level;
    std::string log_file;
};

// Metadata that is always worth dropping: notebook signature and widget state,
// and per-cell UI state written by common front-ends.
const std::vector<std::string>& defaultExtraKeys();

// Settings with the default extra keys and nothing else
Settings defaultSettings();

void applyLayer(Settings& settings, const SettingsLayer& layer);

// Plain integer, or integer followed by k / m / g (powers of 1000, any case).
bool parseSize(const std::string& text, std::uint64_t& outSize, std::string& outError);

bool parseMode(const std::string& text, NotebookMode& outMode, std::string& outError);

std::string modeToString(NotebookMode mode);

} // namespace config
