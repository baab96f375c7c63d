#include "OutputSize.hpp"
#include "../utils/TextUtils.hpp"

namespace nbstripout
{

std::uint64_t outputSize(const nlohmann::json& value)
{
    switch (value.type())
    {
    case nlohmann::json::value_t::string:
        return utils::countCodepoints(value.get_ref<const std::string&>());
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
    {
        std::uint64_t total = 0;
        for (const auto& element : value)
            total += outputSize(element);
        return total;
    }
    case nlohmann::json::value_t::boolean:
        return value.get<bool>() ? 4 : 5;
    case nlohmann::json::value_t::null:
        return 4;
    default:
        return value.dump().size();
    }
}

} // namespace nbstripout
