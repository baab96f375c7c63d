#include "ZeppelinStripper.hpp"
#include "StripResult.hpp"

namespace nbstripout
{

nlohmann::ordered_json stripParagraphFormat(nlohmann::ordered_json notebook)
{
    auto paragraphs = notebook.find("paragraphs");
    if (paragraphs == notebook.end() || !paragraphs->is_array())
        throw MalformedNotebookError("zeppelin notebook has no list of paragraphs");

    for (auto& paragraph : *paragraphs)
    {
        auto results = paragraph.find("results");
        if (results != paragraph.end())
            *results = nlohmann::ordered_json::object();
    }
    return notebook;
}

} // namespace nbstripout
