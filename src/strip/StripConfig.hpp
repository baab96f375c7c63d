#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nbstripout
{

// Options for stripping cell-format (Jupyter) notebooks.
// Built once per invocation and passed by const reference.
struct StripConfig
{
    std::optional<bool> keep_output;            // unset defers to notebook metadata
    bool keep_count = false;                    // keep execution_count / prompt_number
    std::vector<std::string> extra_keys;        // dotted paths rooted at "metadata" or "cell"
    bool drop_empty_cells = false;              // drop cells whose source is blank
    std::vector<std::string> drop_tagged_cells; // drop cells carrying any of these tags
    bool strip_init_cells = false;              // strip cells marked init_cell: true
    std::uint64_t max_size = 0;                 // outputs at or below this size survive stripping
};

} // namespace nbstripout
