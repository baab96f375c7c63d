#include "NotebookIO.hpp"
#include "../utils/TextUtils.hpp"

#include <plog/Log.h>

#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>

namespace nbstripout
{

namespace
{

bool isJsonMime(const std::string& mime)
{
    // application/json, application/vnd.foo+json and the like are stored as JSON values
    const std::string suffix = "json";
    return mime.rfind("application", 0) == 0 && mime.size() >= suffix.size() &&
           mime.compare(mime.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A string or a list of strings becomes the list of its lines; anything else is left alone.
void splitMultiline(nlohmann::json& value)
{
    std::string joined;
    if (value.is_string())
    {
        joined = value.get<std::string>();
    }
    else if (value.is_array())
    {
        for (const auto& piece : value)
        {
            if (!piece.is_string())
                return;
            joined += piece.get_ref<const std::string&>();
        }
    }
    else
    {
        return;
    }

    nlohmann::json lines = nlohmann::json::array();
    for (auto& line : utils::splitLinesKeepEnds(joined))
        lines.push_back(std::move(line));
    value = std::move(lines);
}

void splitMimeBundle(nlohmann::json& bundle)
{
    if (!bundle.is_object())
        return;
    for (auto& [mime, data] : bundle.items())
    {
        if (!isJsonMime(mime))
            splitMultiline(data);
    }
}

void splitOutput(nlohmann::json& output)
{
    if (!output.is_object())
        return;
    const std::string type = output.value("output_type", "");
    if (type == "execute_result" || type == "display_data")
    {
        auto data = output.find("data");
        if (data != output.end())
            splitMimeBundle(*data);
    }
    else if (type == "stream")
    {
        auto text = output.find("text");
        if (text != output.end())
            splitMultiline(*text);
    }
}

void splitCell(nlohmann::json& cell)
{
    if (!cell.is_object())
        return;

    auto source = cell.find("source");
    if (source != cell.end())
        splitMultiline(*source);

    auto metadata = cell.find("metadata");
    if (metadata != cell.end() && metadata->is_object())
        metadata->erase("trusted");

    auto outputs = cell.find("outputs");
    if (outputs != cell.end() && outputs->is_array())
    {
        for (auto& output : *outputs)
            splitOutput(output);
    }

    auto attachments = cell.find("attachments");
    if (attachments != cell.end() && attachments->is_object())
    {
        for (auto& [name, bundle] : attachments->items())
            splitMimeBundle(bundle);
    }
}

template<typename Json>
bool parseStream(std::istream& in, Json& out, std::string& outError)
{
    try
    {
        Json parsed = Json::parse(in);
        if (!parsed.is_object())
        {
            outError = "top-level JSON value is not an object";
            return false;
        }
        out = std::move(parsed);
        return true;
    }
    catch (const nlohmann::json::parse_error& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_DEBUG << outError;
        return false;
    }
}

} // namespace

bool NotebookIO::readJupyter(std::istream& in, nlohmann::json& outNotebook, std::string& outError)
{
    return parseStream(in, outNotebook, outError);
}

bool NotebookIO::readJupyter(const std::string& text, nlohmann::json& outNotebook, std::string& outError)
{
    std::istringstream in(text);
    return parseStream(in, outNotebook, outError);
}

nlohmann::json NotebookIO::toDiskForm(const nlohmann::json& notebook)
{
    nlohmann::json copy = notebook;

    auto nbformat = copy.find("nbformat");
    if (nbformat == copy.end() || !nbformat->is_number_integer() || nbformat->get<std::int64_t>() < 4)
        return copy;

    auto metadata = copy.find("metadata");
    if (metadata != copy.end() && metadata->is_object())
    {
        metadata->erase("orig_nbformat");
        metadata->erase("orig_nbformat_minor");
        metadata->erase("signature");
    }

    auto cells = copy.find("cells");
    if (cells != copy.end() && cells->is_array())
    {
        for (auto& cell : *cells)
            splitCell(cell);
    }
    return copy;
}

void NotebookIO::writeJupyter(const nlohmann::json& notebook, std::ostream& out)
{
    out << toDiskForm(notebook).dump(1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out.flush();
}

bool NotebookIO::writeJupyterFile(const std::filesystem::path& path, const nlohmann::json& notebook,
                                  std::string& outError)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        outError = "Failed to open notebook for writing: " + path.string();
        PLOG_DEBUG << outError;
        return false;
    }
    writeJupyter(notebook, file);
    if (!file)
    {
        outError = "Failed to write notebook: " + path.string();
        PLOG_DEBUG << outError;
        return false;
    }
    return true;
}

bool NotebookIO::readZeppelin(std::istream& in, nlohmann::ordered_json& outNotebook, std::string& outError)
{
    return parseStream(in, outNotebook, outError);
}

void NotebookIO::writeZeppelin(const nlohmann::ordered_json& notebook, std::ostream& out, bool trailingNewline)
{
    out << notebook.dump(2, ' ', true, nlohmann::ordered_json::error_handler_t::replace);
    if (trailingNewline)
        out << '\n';
    out.flush();
}

bool NotebookIO::writeZeppelinFile(const std::filesystem::path& path, const nlohmann::ordered_json& notebook,
                                   std::string& outError)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        outError = "Failed to open note for writing: " + path.string();
        PLOG_DEBUG << outError;
        return false;
    }
    writeZeppelin(notebook, file, false);
    if (!file)
    {
        outError = "Failed to write note: " + path.string();
        PLOG_DEBUG << outError;
        return false;
    }
    return true;
}

} // namespace nbstripout
