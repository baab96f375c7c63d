#pragma once

#include <cstdint>

#include <nlohmann/json.hpp>

namespace nbstripout
{

/// Recursive textual size of a value, used to keep small outputs.
/// Strings count code points, arrays and objects sum their elements
/// (object keys are not counted), other scalars count the length of
/// their printed form (True, False, None, or the number as written).
[[nodiscard]] std::uint64_t outputSize(const nlohmann::json& value);

} // namespace nbstripout
