#pragma once

#include "StripConfig.hpp"

#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

namespace nbstripout
{

// Returns true for cells that survive.
using CellPredicate = std::function<bool(const nlohmann::json& cell)>;

/// True when at least one source line has non-whitespace content.
/// Accepts a list of lines or a single string; a missing source is blank.
[[nodiscard]] bool hasNonBlankSource(const nlohmann::json& cell);

/// Filters in application order: the blank-source filter (when enabled)
/// followed by one filter per tag in drop_tagged_cells.
[[nodiscard]] std::vector<CellPredicate> buildCellFilters(const StripConfig& config);

/// Apply each filter in turn to `cells`, erasing cells that fail it.
/// Survivors keep their relative order.
void applyCellFilters(nlohmann::json& cells, const std::vector<CellPredicate>& filters);

} // namespace nbstripout
