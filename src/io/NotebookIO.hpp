#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

namespace nbstripout
{

// Reading and writing notebook documents.
//
// Jupyter notebooks are held in nlohmann::json (sorted keys, which is how
// Jupyter writes them). Zeppelin notes are held in nlohmann::ordered_json so
// their key order survives a round trip.
class NotebookIO
{
public:
    // Parse a Jupyter notebook. Returns false with outError set when the text
    // is not JSON or the top level is not an object.
    static bool readJupyter(std::istream& in, nlohmann::json& outNotebook, std::string& outError);
    static bool readJupyter(const std::string& text, nlohmann::json& outNotebook, std::string& outError);

    // Write a notebook the way Jupyter stores it on disk: one-space indent,
    // sorted keys, unescaped UTF-8, trailing newline. For nbformat 4 and later,
    // multi-line text is written as lists of lines and transient metadata
    // (orig_nbformat, signature, cell "trusted") is dropped.
    static void writeJupyter(const nlohmann::json& notebook, std::ostream& out);
    static bool writeJupyterFile(const std::filesystem::path& path, const nlohmann::json& notebook,
                                 std::string& outError);

    static bool readZeppelin(std::istream& in, nlohmann::ordered_json& outNotebook, std::string& outError);

    // Two-space indent, ASCII-escaped, insertion order kept.
    static void writeZeppelin(const nlohmann::ordered_json& notebook, std::ostream& out, bool trailingNewline);
    static bool writeZeppelinFile(const std::filesystem::path& path, const nlohmann::ordered_json& notebook,
                                  std::string& outError);

    // Applies the on-disk line splitting and transient-field removal to a copy.
    [[nodiscard]] static nlohmann::json toDiskForm(const nlohmann::json& notebook);
};

} // namespace nbstripout
