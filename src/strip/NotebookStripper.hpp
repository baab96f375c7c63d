#pragma once

#include "StripConfig.hpp"
#include "StripResult.hpp"
#include "WarningContext.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nbstripout
{

/// Extra keys split by root: "metadata.x" goes to notebook_keys as "x",
/// "cell.y" goes to cell_keys as "y". Anything else is reported and dropped.
struct ExtraKeyGroups
{
    std::vector<std::string> notebook_keys;
    std::vector<std::string> cell_keys;
};

[[nodiscard]] ExtraKeyGroups partitionExtraKeys(const std::vector<std::string>& extra_keys,
                                                const WarningContext* warnings = nullptr);

/// Strip outputs, execution counters and extra metadata from a Jupyter notebook.
///
/// The notebook is taken by value; move it in and read it back from the
/// result. A cell whose metadata contradicts its tags fails the whole call.
/// Structural problems throw MalformedNotebookError or nlohmann::json::exception.
[[nodiscard]] StripResult<nlohmann::json> stripCellFormat(nlohmann::json notebook, const StripConfig& config,
                                                          const WarningContext* warnings = nullptr);

} // namespace nbstripout
