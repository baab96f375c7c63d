#include "Settings.hpp"

#include <cctype>
#include <limits>

namespace config
{

const std::vector<std::string>& defaultExtraKeys()
{
    static const std::vector<std::string> keys = {
        "metadata.signature",
        "metadata.widgets",
        "cell.metadata.collapsed",
        "cell.metadata.ExecuteTime",
        "cell.metadata.execution",
        "cell.metadata.heading_collapsed",
        "cell.metadata.hidden",
        "cell.metadata.scrolled",
    };
    return keys;
}

Settings defaultSettings()
{
    Settings settings;
    settings.strip.extra_keys = defaultExtraKeys();
    return settings;
}

void applyLayer(Settings& settings, const SettingsLayer& layer)
{
    auto& strip = settings.strip;
    if (layer.keep_output)
        strip.keep_output = layer.keep_output;
    if (layer.keep_count)
        strip.keep_count = *layer.keep_count;
    strip.extra_keys.insert(strip.extra_keys.end(), layer.extra_keys.begin(), layer.extra_keys.end());
    if (layer.drop_empty_cells)
        strip.drop_empty_cells = *layer.drop_empty_cells;
    if (layer.drop_tagged_cells)
        strip.drop_tagged_cells = *layer.drop_tagged_cells;
    if (layer.strip_init_cells)
        strip.strip_init_cells = *layer.strip_init_cells;
    if (layer.max_size)
        strip.max_size = *layer.max_size;
    if (layer.mode)
        settings.mode = *layer.mode;
    if (layer.log_level)
        settings.log_level = layer.log_level;
    if (layer.log_file)
        settings.log_file = *layer.log_file;
}

bool parseSize(const std::string& text, std::uint64_t& outSize, std::string& outError)
{
    if (text.empty())
    {
        outError = "Empty size";
        return false;
    }

    std::uint64_t multiplier = 1;
    std::string digits = text;
    const char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    if (!std::isdigit(static_cast<unsigned char>(suffix)))
    {
        switch (suffix)
        {
        case 'K':
            multiplier = 1000ULL;
            break;
        case 'M':
            multiplier = 1000ULL * 1000ULL;
            break;
        case 'G':
            multiplier = 1000ULL * 1000ULL * 1000ULL;
            break;
        default:
            outError = std::string("Unknown size identifier ") + suffix;
            return false;
        }
        digits.pop_back();
    }

    if (digits.empty())
    {
        outError = "Invalid size '" + text + "'";
        return false;
    }

    std::uint64_t value = 0;
    for (char c : digits)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            outError = "Invalid size '" + text + "'";
            return false;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
        {
            outError = "Size '" + text + "' is too large";
            return false;
        }
        value = value * 10 + digit;
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier)
    {
        outError = "Size '" + text + "' is too large";
        return false;
    }

    outSize = value * multiplier;
    return true;
}

bool parseMode(const std::string& text, NotebookMode& outMode, std::string& outError)
{
    if (text == "jupyter")
    {
        outMode = NotebookMode::Jupyter;
        return true;
    }
    if (text == "zeppelin")
    {
        outMode = NotebookMode::Zeppelin;
        return true;
    }
    outError = "invalid choice: '" + text + "' (choose from 'jupyter', 'zeppelin')";
    return false;
}

std::string modeToString(NotebookMode mode)
{
    switch (mode)
    {
    case NotebookMode::Jupyter:
        return "jupyter";
    case NotebookMode::Zeppelin:
        return "zeppelin";
    default:
        return "jupyter";
    }
}

} // namespace config
