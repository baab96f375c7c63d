#include "RetentionPolicy.hpp"
#include "StripResult.hpp"

#include <algorithm>

namespace nbstripout
{

namespace
{

const nlohmann::json* findMember(const nlohmann::json& object, const char* key)
{
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

const nlohmann::json& requireObject(const nlohmann::json& value, const char* what)
{
    if (!value.is_object())
        throw MalformedNotebookError(std::string(what) + " is not an object");
    return value;
}

} // namespace

bool isTruthy(const nlohmann::json& value)
{
    switch (value.type())
    {
    case nlohmann::json::value_t::null:
        return false;
    case nlohmann::json::value_t::boolean:
        return value.get<bool>();
    case nlohmann::json::value_t::number_integer:
        return value.get<std::int64_t>() != 0;
    case nlohmann::json::value_t::number_unsigned:
        return value.get<std::uint64_t>() != 0;
    case nlohmann::json::value_t::number_float:
        return value.get<double>() != 0.0;
    case nlohmann::json::value_t::string:
        return !value.get_ref<const std::string&>().empty();
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
        return !value.empty();
    default:
        return true;
    }
}

bool cellHasTag(const nlohmann::json& cell, const std::string& tag)
{
    const nlohmann::json* metadata = findMember(cell, "metadata");
    if (!metadata)
        return false;

    const nlohmann::json* tags = findMember(requireObject(*metadata, "cell metadata"), "tags");
    if (!tags)
        return false;
    if (!tags->is_array())
        throw MalformedNotebookError("cell metadata tags is not a list");

    return std::find(tags->begin(), tags->end(), tag) != tags->end();
}

OutputRetention resolveOutputRetention(const nlohmann::json& cell, bool keep_by_default, bool strip_init_cells)
{
    const auto fallback = keep_by_default ? OutputRetention::Keep : OutputRetention::Strip;

    const nlohmann::json* metadata = findMember(cell, "metadata");
    if (!metadata)
        return fallback;
    requireObject(*metadata, "cell metadata");

    // init_cell is the more specific marker and overrides keep_output entirely
    if (const nlohmann::json* init_cell = findMember(*metadata, "init_cell"))
        return (isTruthy(*init_cell) && !strip_init_cells) ? OutputRetention::Keep : OutputRetention::Strip;

    const nlohmann::json* keep_output = findMember(*metadata, "keep_output");
    const bool keep_output_value = keep_output && isTruthy(*keep_output);
    const bool has_tag = cellHasTag(cell, "keep_output");

    if (keep_output && has_tag && !keep_output_value)
        return OutputRetention::Contradiction;

    if (keep_output || has_tag)
        return (keep_output_value || has_tag) ? OutputRetention::Keep : OutputRetention::Strip;

    return fallback;
}

} // namespace nbstripout
