#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace nbstripout
{

enum class OutputRetention
{
    Keep,
    Strip,
    Contradiction // metadata keep_output is false but tags contain "keep_output"
};

/// Truthiness of a JSON value: null, false, 0, "" and empty containers are false.
[[nodiscard]] bool isTruthy(const nlohmann::json& value);

/// Decide whether a cell keeps its outputs.
///
/// Rules, first match wins:
///  - no "metadata": the default
///  - "metadata.init_cell" present: truthy(init_cell) && !strip_init_cells
///  - "metadata.keep_output" and/or a "keep_output" tag present: either one
///    (a false metadata value next to the tag is a contradiction)
///  - otherwise the default
///
/// Throws MalformedNotebookError when metadata or tags have the wrong type.
[[nodiscard]] OutputRetention resolveOutputRetention(const nlohmann::json& cell, bool keep_by_default,
                                                     bool strip_init_cells);

/// Whether "metadata.tags" of the cell contains `tag`. Missing metadata or tags
/// mean no tags.
[[nodiscard]] bool cellHasTag(const nlohmann::json& cell, const std::string& tag);

} // namespace nbstripout
