#pragma once

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace nbstripout
{

/// Remove and return the value at a dotted path such as "a.b.c".
/// At every level a literal key equal to the whole remaining path wins over
/// descending into nested objects. Returns std::nullopt when the path does
/// not resolve through objects.
[[nodiscard]] std::optional<nlohmann::json> popPath(nlohmann::json& object, std::string_view path);

} // namespace nbstripout
