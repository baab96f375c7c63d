#pragma once

#include <nlohmann/json.hpp>

namespace nbstripout
{

/// Clear the "results" of every Zeppelin paragraph to an empty object.
/// Key order is preserved, so the document is an ordered_json.
/// Throws MalformedNotebookError when "paragraphs" is missing or not a list.
[[nodiscard]] nlohmann::ordered_json stripParagraphFormat(nlohmann::ordered_json notebook);

} // namespace nbstripout
