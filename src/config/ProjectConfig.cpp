#include "ProjectConfig.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/TextUtils.hpp"

#include <plog/Log.h>
#include <fstream>

namespace fs = std::filesystem;

namespace config
{

namespace
{

// A string of whitespace separated words, or an array of strings
std::optional<std::vector<std::string>> readWordList(const toml::node& node)
{
    if (auto text = node.value<std::string>())
        return utils::splitWhitespace(*text);

    const toml::array* array = node.as_array();
    if (!array)
        return std::nullopt;

    std::vector<std::string> words;
    for (const auto& element : *array)
    {
        auto word = element.value<std::string>();
        if (!word)
            return std::nullopt;
        words.push_back(*word);
    }
    return words;
}

} // namespace

std::optional<fs::path> ProjectConfig::find(const fs::path& start_dir)
{
    std::error_code ec;
    fs::path dir = fs::absolute(start_dir, ec);
    if (ec)
        return std::nullopt;

    while (true)
    {
        fs::path candidate = dir / kFileName;
        if (fs::is_regular_file(candidate, ec))
            return candidate;
        if (!dir.has_parent_path() || dir.parent_path() == dir)
            return std::nullopt;
        dir = dir.parent_path();
    }
}

bool ProjectConfig::loadFile(const fs::path& path, SettingsLayer& outLayer)
{
    last_error_.clear();
    source_name_ = path.string();

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return true;

    try
    {
        toml::table root = toml::parse(ifs, path.string());
        return loadTable(root, outLayer);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "Error at line " + std::to_string(pe.source().begin.line) + " of " + source_name_ + ": " +
                      std::string(pe.description());
        PLOG_DEBUG << "pyproject parse error: " << last_error_;
        return false;
    }
}

bool ProjectConfig::loadString(const std::string& content, SettingsLayer& outLayer)
{
    last_error_.clear();
    try
    {
        toml::table root = toml::parse(content);
        return loadTable(root, outLayer);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        return false;
    }
}

void ProjectConfig::warn(const std::string& message)
{
    warnings_.push_back(message);
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, message, source_name_);
}

bool ProjectConfig::loadTable(const toml::table& root, SettingsLayer& outLayer)
{
    const toml::table* section = root["tool"]["nbstripout"].as_table();
    if (!section)
        return true;

    auto readBool = [this](const std::string& key, const toml::node& node, std::optional<bool>& out)
    {
        if (auto value = node.value<bool>())
            out = *value;
        else
            warn("Ignoring [tool.nbstripout] " + key + ": expected a boolean");
    };

    for (auto&& [key, node] : *section)
    {
        const std::string name(key.str());

        if (name == "keep_output")
        {
            readBool(name, node, outLayer.keep_output);
        }
        else if (name == "keep_count")
        {
            readBool(name, node, outLayer.keep_count);
        }
        else if (name == "drop_empty_cells")
        {
            readBool(name, node, outLayer.drop_empty_cells);
        }
        else if (name == "strip_init_cells")
        {
            readBool(name, node, outLayer.strip_init_cells);
        }
        else if (name == "extra_keys")
        {
            if (auto words = readWordList(node))
                outLayer.extra_keys.insert(outLayer.extra_keys.end(), words->begin(), words->end());
            else
                warn("Ignoring [tool.nbstripout] extra_keys: expected a string or a list of strings");
        }
        else if (name == "drop_tagged_cells")
        {
            if (auto words = readWordList(node))
                outLayer.drop_tagged_cells = std::move(*words);
            else
                warn("Ignoring [tool.nbstripout] drop_tagged_cells: expected a string or a list of strings");
        }
        else if (name == "max_size")
        {
            if (auto number = node.value<std::int64_t>())
            {
                if (*number >= 0)
                    outLayer.max_size = static_cast<std::uint64_t>(*number);
                else
                    warn("Ignoring [tool.nbstripout] max_size: must not be negative");
            }
            else if (auto text = node.value<std::string>())
            {
                std::uint64_t size = 0;
                std::string error;
                if (parseSize(*text, size, error))
                    outLayer.max_size = size;
                else
                    warn("Ignoring [tool.nbstripout] max_size: " + error);
            }
            else
            {
                warn("Ignoring [tool.nbstripout] max_size: expected an integer or a size string");
            }
        }
        else if (name == "mode")
        {
            NotebookMode mode = NotebookMode::Jupyter;
            std::string error;
            auto text = node.value<std::string>();
            if (text && parseMode(*text, mode, error))
                outLayer.mode = mode;
            else
                warn("Ignoring [tool.nbstripout] mode: " + (text ? error : std::string("expected a string")));
        }
        else if (name == "log_level")
        {
            auto level = node.value<std::int64_t>();
            if (level && *level >= 0 && *level <= 6)
                outLayer.log_level = *level;
            else
                warn("Ignoring [tool.nbstripout] log_level: expected an integer from 0 to 6");
        }
        else if (name == "log_file")
        {
            if (auto text = node.value<std::string>())
                outLayer.log_file = *text;
            else
                warn("Ignoring [tool.nbstripout] log_file: expected a string");
        }
        else
        {
            warn("Ignoring unknown option [tool.nbstripout] " + name);
        }
    }

    PLOG_DEBUG << "Loaded [tool.nbstripout] from " << source_name_;
    return true;
}

} // namespace config
