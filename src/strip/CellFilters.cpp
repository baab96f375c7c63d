#include "CellFilters.hpp"
#include "RetentionPolicy.hpp"
#include "StripResult.hpp"
#include "../utils/TextUtils.hpp"

#include <algorithm>

namespace nbstripout
{

bool hasNonBlankSource(const nlohmann::json& cell)
{
    auto it = cell.find("source");
    if (it == cell.end())
        return false;

    const nlohmann::json& source = *it;
    if (source.is_string())
        return !utils::isBlank(source.get_ref<const std::string&>());
    if (!source.is_array())
        throw MalformedNotebookError("cell source is neither a string nor a list of lines");

    return std::any_of(source.begin(), source.end(),
                       [](const nlohmann::json& line)
                       {
                           return !utils::isBlank(line.get_ref<const std::string&>());
                       });
}

std::vector<CellPredicate> buildCellFilters(const StripConfig& config)
{
    std::vector<CellPredicate> filters;
    if (config.drop_empty_cells)
        filters.emplace_back(hasNonBlankSource);

    for (const auto& tag : config.drop_tagged_cells)
    {
        filters.emplace_back([tag](const nlohmann::json& cell)
                             {
                                 return !cellHasTag(cell, tag);
                             });
    }
    return filters;
}

void applyCellFilters(nlohmann::json& cells, const std::vector<CellPredicate>& filters)
{
    if (!cells.is_array())
        throw MalformedNotebookError("notebook cells is not a list");

    for (const auto& keep : filters)
    {
        nlohmann::json survivors = nlohmann::json::array();
        for (auto& cell : cells)
        {
            if (keep(cell))
                survivors.push_back(std::move(cell));
        }
        cells = std::move(survivors);
    }
}

} // namespace nbstripout
