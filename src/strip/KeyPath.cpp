#include "KeyPath.hpp"

#include <string>

namespace nbstripout
{

std::optional<nlohmann::json> popPath(nlohmann::json& object, std::string_view path)
{
    if (!object.is_object())
        return std::nullopt;

    auto it = object.find(std::string(path));
    if (it != object.end())
    {
        nlohmann::json value = std::move(*it);
        object.erase(it);
        return value;
    }

    const auto dot = path.find('.');
    if (dot == std::string_view::npos)
        return std::nullopt;

    auto head = object.find(std::string(path.substr(0, dot)));
    if (head == object.end())
        return std::nullopt;

    return popPath(*head, path.substr(dot + 1));
}

} // namespace nbstripout
