#include <catch2/catch_test_macros.hpp>

#include "io/NotebookIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using nbstripout::NotebookIO;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{

class TempFile
{
public:
    explicit TempFile(const std::string& name)
        : path_(fs::temp_directory_path() / name)
    {
    }

    ~TempFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

    std::string read() const
    {
        std::ifstream in(path_, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("readJupyter rejects non-notebooks", "[notebook_io]")
{
    json nb;
    std::string error;

    SECTION("Not JSON")
    {
        REQUIRE_FALSE(NotebookIO::readJupyter(std::string("{not json"), nb, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Top level is not an object")
    {
        REQUIRE_FALSE(NotebookIO::readJupyter(std::string("[1, 2]"), nb, error));
        REQUIRE(error == "top-level JSON value is not an object");
    }

    SECTION("Valid notebook")
    {
        REQUIRE(NotebookIO::readJupyter(std::string(R"({"nbformat": 4, "cells": []})"), nb, error));
        REQUIRE(nb["nbformat"] == 4);
    }
}

TEST_CASE("writeJupyter matches the on-disk layout", "[notebook_io]")
{
    const json nb = json::parse(R"({
        "nbformat": 4, "nbformat_minor": 5,
        "metadata": {"orig_nbformat": 3, "language_info": {"name": "python"}},
        "cells": [{"cell_type": "code", "metadata": {"trusted": true}, "source": "a = 1\nb = 2", "outputs": [], "execution_count": null}]
    })");

    std::ostringstream out;
    NotebookIO::writeJupyter(nb, out);

    const std::string expected =
        "{\n"
        " \"cells\": [\n"
        "  {\n"
        "   \"cell_type\": \"code\",\n"
        "   \"execution_count\": null,\n"
        "   \"metadata\": {},\n"
        "   \"outputs\": [],\n"
        "   \"source\": [\n"
        "    \"a = 1\\n\",\n"
        "    \"b = 2\"\n"
        "   ]\n"
        "  }\n"
        " ],\n"
        " \"metadata\": {\n"
        "  \"language_info\": {\n"
        "   \"name\": \"python\"\n"
        "  }\n"
        " },\n"
        " \"nbformat\": 4,\n"
        " \"nbformat_minor\": 5\n"
        "}\n";
    REQUIRE(out.str() == expected);
}

TEST_CASE("toDiskForm splits text fields", "[notebook_io]")
{
    const json nb = json::parse(R"({
        "nbformat": 4, "nbformat_minor": 4, "metadata": {},
        "cells": [{
            "cell_type": "code", "metadata": {}, "source": ["x = 1\ny", " = 2"],
            "outputs": [
                {"output_type": "stream", "name": "stdout", "text": "one\ntwo\n"},
                {"output_type": "display_data", "metadata": {},
                 "data": {"text/plain": "a\nb", "application/json": {"k": "v\nw"}, "application/vnd.custom+json": "x\ny"}}
            ]
        }]
    })");

    const json disk = NotebookIO::toDiskForm(nb);
    const json& cell = disk["cells"][0];

    REQUIRE(cell["source"] == json::parse(R"(["x = 1\n", "y = 2"])"));
    REQUIRE(cell["outputs"][0]["text"] == json::parse(R"(["one\n", "two\n"])"));
    REQUIRE(cell["outputs"][1]["data"]["text/plain"] == json::parse(R"(["a\n", "b"])"));
    REQUIRE(cell["outputs"][1]["data"]["application/json"] == json::parse(R"({"k": "v\nw"})"));
    REQUIRE(cell["outputs"][1]["data"]["application/vnd.custom+json"] == "x\ny");
}

TEST_CASE("toDiskForm leaves legacy notebooks alone", "[notebook_io]")
{
    const json nb = json::parse(R"({"nbformat": 3, "metadata": {"signature": "s"}, "worksheets": [{"cells": [{"input": "a\nb"}]}]})");
    REQUIRE(NotebookIO::toDiskForm(nb) == nb);
}

TEST_CASE("Unicode is written unescaped", "[notebook_io]")
{
    const json nb = json::parse(R"({"nbformat": 4, "metadata": {"title": "日本語"}, "cells": []})");
    std::ostringstream out;
    NotebookIO::writeJupyter(nb, out);
    REQUIRE(out.str().find("日本語") != std::string::npos);
}

TEST_CASE("Zeppelin notes keep order and escape non-ASCII", "[notebook_io]")
{
    nlohmann::ordered_json note;
    std::string error;
    std::istringstream in(R"({"paragraphs": [], "name": "é"})");
    REQUIRE(NotebookIO::readZeppelin(in, note, error));

    SECTION("Stream output ends with a newline")
    {
        std::ostringstream out;
        NotebookIO::writeZeppelin(note, out, true);
        REQUIRE(out.str() == "{\n  \"paragraphs\": [],\n  \"name\": \"\\u00e9\"\n}\n");
    }

    SECTION("File output has no trailing newline")
    {
        TempFile file("nbstripout_io_test.zpln");
        REQUIRE(NotebookIO::writeZeppelinFile(file.path(), note, error));
        REQUIRE(file.read() == "{\n  \"paragraphs\": [],\n  \"name\": \"\\u00e9\"\n}");
    }
}

TEST_CASE("writeJupyterFile round trip", "[notebook_io]")
{
    TempFile file("nbstripout_io_test.ipynb");
    const json nb = json::parse(R"({"nbformat": 4, "nbformat_minor": 5, "metadata": {}, "cells": []})");
    std::string error;

    REQUIRE(NotebookIO::writeJupyterFile(file.path(), nb, error));

    json back;
    REQUIRE(NotebookIO::readJupyter(file.read(), back, error));
    REQUIRE(back == nb);
}
