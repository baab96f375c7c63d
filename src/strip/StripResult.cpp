#include "StripResult.hpp"

#include <sstream>

namespace nbstripout
{

std::string MetadataContradiction::message() const
{
    std::ostringstream oss;
    oss << "cell metadata contradicts tags: `keep_output` is false, but `keep_output` in tags (cell " << cell_index;
    if (worksheet)
        oss << " of worksheet " << *worksheet;
    if (cell_id)
        oss << ", id " << *cell_id;
    oss << ")";
    return oss.str();
}

} // namespace nbstripout
