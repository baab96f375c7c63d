#include "NotebookStripper.hpp"
#include "CellFilters.hpp"
#include "KeyPath.hpp"
#include "OutputSize.hpp"
#include "RetentionPolicy.hpp"

#include <optional>

namespace nbstripout
{

namespace
{

nlohmann::json& requireMember(nlohmann::json& object, const char* key, const char* context)
{
    if (!object.is_object())
        throw MalformedNotebookError(std::string(context) + " is not an object");
    auto it = object.find(key);
    if (it == object.end())
        throw MalformedNotebookError(std::string(context) + " has no '" + key + "' field");
    return *it;
}

bool effectiveKeepOutput(const nlohmann::json& notebook_metadata, const StripConfig& config)
{
    if (config.keep_output)
        return *config.keep_output;

    auto it = notebook_metadata.find("keep_output");
    if (it != notebook_metadata.end())
        return isTruthy(*it);
    return false;
}

void stripOutputs(nlohmann::json& outputs, bool keep_this_cell, const StripConfig& config)
{
    if (!outputs.is_array())
        throw MalformedNotebookError("cell outputs is not a list");

    // Deliberately differs from filtering first: counters are cleared before measuring
    // so a second pass sees the same sizes
    if (!config.keep_count)
    {
        for (auto& output : outputs)
        {
            auto count = output.find("execution_count");
            if (count != output.end())
                *count = nullptr;
        }
    }

    // max_size == 0 keeps nothing
    if (!keep_this_cell)
    {
        nlohmann::json small = nlohmann::json::array();
        for (auto& output : outputs)
        {
            if (outputSize(output) <= config.max_size)
                small.push_back(std::move(output));
        }
        outputs = std::move(small);
    }
}

std::optional<MetadataContradiction> stripCell(nlohmann::json& cell, bool keep_output, const StripConfig& config,
                                               const ExtraKeyGroups& keys)
{
    if (!cell.is_object())
        throw MalformedNotebookError("notebook cell is not an object");

    const OutputRetention retention = resolveOutputRetention(cell, keep_output, config.strip_init_cells);
    if (retention == OutputRetention::Contradiction)
    {
        MetadataContradiction err;
        auto id = cell.find("id");
        if (id != cell.end() && id->is_string())
            err.cell_id = id->get<std::string>();
        return err;
    }

    auto outputs = cell.find("outputs");
    if (outputs != cell.end())
        stripOutputs(*outputs, retention == OutputRetention::Keep, config);

    if (!config.keep_count)
    {
        auto prompt = cell.find("prompt_number");
        if (prompt != cell.end())
            *prompt = nullptr;
        auto count = cell.find("execution_count");
        if (count != cell.end())
            *count = nullptr;
    }

    for (const auto& key : keys.cell_keys)
        (void)popPath(cell, key);

    return std::nullopt;
}

// Filters one cell list, then strips its survivors in order.
std::optional<MetadataContradiction> processCells(nlohmann::json& cells, const std::vector<CellPredicate>& filters,
                                                  bool keep_output, const StripConfig& config,
                                                  const ExtraKeyGroups& keys)
{
    applyCellFilters(cells, filters);

    std::size_t index = 0;
    for (auto& cell : cells)
    {
        if (auto err = stripCell(cell, keep_output, config, keys))
        {
            err->cell_index = index;
            return err;
        }
        ++index;
    }
    return std::nullopt;
}

} // namespace

ExtraKeyGroups partitionExtraKeys(const std::vector<std::string>& extra_keys, const WarningContext* warnings)
{
    ExtraKeyGroups groups;
    for (const auto& key : extra_keys)
    {
        const auto dot = key.find('.');
        const std::string root = dot == std::string::npos ? std::string() : key.substr(0, dot);
        if (root == "metadata")
        {
            groups.notebook_keys.push_back(key.substr(dot + 1));
        }
        else if (root == "cell")
        {
            groups.cell_keys.push_back(key.substr(dot + 1));
        }
        else if (warnings)
        {
            warnings->ReportWarning("Ignoring invalid extra key `" + key + "`");
        }
    }
    return groups;
}

StripResult<nlohmann::json> stripCellFormat(nlohmann::json notebook, const StripConfig& config,
                                            const WarningContext* warnings)
{
    nlohmann::json& metadata = requireMember(notebook, "metadata", "notebook");
    if (!metadata.is_object())
        throw MalformedNotebookError("notebook metadata is not an object");

    const bool keep_output = effectiveKeepOutput(metadata, config);
    const ExtraKeyGroups keys = partitionExtraKeys(config.extra_keys, warnings);

    for (const auto& key : keys.notebook_keys)
        (void)popPath(metadata, key);

    const auto filters = buildCellFilters(config);

    const nlohmann::json& nbformat = requireMember(notebook, "nbformat", "notebook");
    if (!nbformat.is_number_integer())
        throw MalformedNotebookError("notebook nbformat is not an integer");

    if (nbformat.get<std::int64_t>() < 4)
    {
        nlohmann::json& worksheets = requireMember(notebook, "worksheets", "notebook");
        if (!worksheets.is_array())
            throw MalformedNotebookError("notebook worksheets is not a list");

        std::size_t worksheet_index = 0;
        for (auto& worksheet : worksheets)
        {
            nlohmann::json& cells = requireMember(worksheet, "cells", "worksheet");
            if (auto err = processCells(cells, filters, keep_output, config, keys))
            {
                err->worksheet = worksheet_index;
                return StripResult<nlohmann::json>::failure(std::move(*err));
            }
            ++worksheet_index;
        }
    }
    else
    {
        nlohmann::json& cells = requireMember(notebook, "cells", "notebook");
        if (auto err = processCells(cells, filters, keep_output, config, keys))
            return StripResult<nlohmann::json>::failure(std::move(*err));
    }

    return StripResult<nlohmann::json>::success(std::move(notebook));
}

} // namespace nbstripout
