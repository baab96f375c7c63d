#include <catch2/catch_test_macros.hpp>

#include "config/Settings.hpp"
#include "strip/NotebookStripper.hpp"

#include <string>
#include <vector>

using namespace nbstripout;
using json = nlohmann::json;

namespace
{

json makeNotebook(const json& cells, const json& metadata = json::object())
{
    json nb;
    nb["nbformat"] = 4;
    nb["nbformat_minor"] = 5;
    nb["metadata"] = metadata;
    nb["cells"] = cells;
    return nb;
}

json stripOrFail(json nb, const StripConfig& config)
{
    auto result = stripCellFormat(std::move(nb), config);
    REQUIRE(result);
    return result.document;
}

const char* kMixedCells = R"([
    {"cell_type": "markdown", "metadata": {}, "source": ["# Title"]},
    {"cell_type": "code", "execution_count": 7, "metadata": {"collapsed": true, "scrolled": false},
     "outputs": [
        {"output_type": "execute_result", "execution_count": 7, "data": {"text/plain": ["42"]}, "metadata": {}},
        {"output_type": "stream", "name": "stdout", "text": ["a long line of printed text\n"]}
     ],
     "source": ["6 * 7"]},
    {"cell_type": "code", "execution_count": 8, "metadata": {"tags": ["keep_output"]},
     "outputs": [{"output_type": "execute_result", "execution_count": 8, "data": {"text/plain": ["1"]}, "metadata": {}}],
     "source": ["1"]}
])";

} // namespace

TEST_CASE("Default configuration clears outputs and counters", "[strip]")
{
    const json cell = json::parse(
        R"({"source": ["1+1"], "outputs": [{"execution_count": 3, "data": {"text/plain": "2"}}], "execution_count": 3})");

    const json stripped = stripOrFail(makeNotebook(json::array({ cell })), StripConfig{});

    REQUIRE(stripped["cells"][0] == json::parse(R"({"source": ["1+1"], "outputs": [], "execution_count": null})"));
}

TEST_CASE("Stripping is idempotent", "[strip]")
{
    StripConfig config;
    config.extra_keys = config::defaultExtraKeys();
    config.max_size = 10;
    config.drop_empty_cells = true;

    const json once = stripOrFail(makeNotebook(json::parse(kMixedCells)), config);
    const json twice = stripOrFail(once, config);

    REQUIRE(once == twice);
}

TEST_CASE("Outputs kept by tag keep their shape", "[strip]")
{
    const json stripped = stripOrFail(makeNotebook(json::parse(kMixedCells)), StripConfig{});
    const json& cells = stripped["cells"];

    REQUIRE(cells.size() == 3);
    REQUIRE(cells[1]["outputs"].empty());
    REQUIRE(cells[1]["execution_count"].is_null());

    SECTION("Tagged cell keeps outputs but loses counters")
    {
        REQUIRE(cells[2]["outputs"].size() == 1);
        REQUIRE(cells[2]["outputs"][0]["execution_count"].is_null());
        REQUIRE(cells[2]["outputs"][0]["data"]["text/plain"][0] == "1");
        REQUIRE(cells[2]["execution_count"].is_null());
    }

    SECTION("Markdown cell is untouched")
    {
        REQUIRE(cells[0] == json::parse(R"({"cell_type": "markdown", "metadata": {}, "source": ["# Title"]})"));
    }
}

TEST_CASE("keep_count preserves execution counts", "[strip]")
{
    StripConfig config;
    config.keep_count = true;

    const json stripped = stripOrFail(makeNotebook(json::parse(kMixedCells)), config);

    REQUIRE(stripped["cells"][1]["execution_count"] == 7);
    REQUIRE(stripped["cells"][2]["execution_count"] == 8);
    REQUIRE(stripped["cells"][2]["outputs"][0]["execution_count"] == 8);
}

TEST_CASE("keep_output resolution", "[strip]")
{
    SECTION("Explicit keep_output keeps every output")
    {
        StripConfig config;
        config.keep_output = true;
        const json stripped = stripOrFail(makeNotebook(json::parse(kMixedCells)), config);
        REQUIRE(stripped["cells"][1]["outputs"].size() == 2);
        REQUIRE(stripped["cells"][1]["outputs"][0]["execution_count"].is_null());
    }

    SECTION("Notebook metadata applies when the flag is unset")
    {
        const json stripped = stripOrFail(
            makeNotebook(json::parse(kMixedCells), json::parse(R"({"keep_output": true})")), StripConfig{});
        REQUIRE(stripped["cells"][1]["outputs"].size() == 2);
    }

    SECTION("Explicit false overrides notebook metadata")
    {
        StripConfig config;
        config.keep_output = false;
        const json stripped = stripOrFail(
            makeNotebook(json::parse(kMixedCells), json::parse(R"({"keep_output": true})")), config);
        REQUIRE(stripped["cells"][1]["outputs"].empty());
    }

    SECTION("Cell metadata false strips despite keeping by default")
    {
        json cells = json::parse(kMixedCells);
        cells[1]["metadata"]["keep_output"] = false;
        StripConfig config;
        config.keep_output = true;
        const json stripped = stripOrFail(makeNotebook(cells), config);
        REQUIRE(stripped["cells"][1]["outputs"].empty());
    }
}

TEST_CASE("max_size keeps small outputs", "[strip]")
{
    // Sizes: 4 for the nulled count plus 2 for "42", then 6 + 2
    const json cells = json::parse(R"([
        {"cell_type": "code", "execution_count": 1, "metadata": {}, "source": ["print(42)"],
         "outputs": [
            {"execution_count": 1, "data": {"text/plain": "42"}},
            {"output_type": "stream", "text": "hi"}
         ]}
    ])");

    SECTION("Threshold is inclusive")
    {
        StripConfig config;
        config.max_size = 6;
        const json stripped = stripOrFail(makeNotebook(cells), config);
        const json& outputs = stripped["cells"][0]["outputs"];
        REQUIRE(outputs.size() == 1);
        REQUIRE(outputs[0]["data"]["text/plain"] == "42");
        REQUIRE(outputs[0]["execution_count"].is_null());
    }

    SECTION("Below the smallest output nothing survives")
    {
        StripConfig config;
        config.max_size = 5;
        const json stripped = stripOrFail(makeNotebook(cells), config);
        REQUIRE(stripped["cells"][0]["outputs"].empty());
    }

    SECTION("Large threshold keeps everything")
    {
        StripConfig config;
        config.max_size = 8;
        const json stripped = stripOrFail(makeNotebook(cells), config);
        REQUIRE(stripped["cells"][0]["outputs"].size() == 2);
    }

    SECTION("Second pass keeps what the first pass kept")
    {
        StripConfig config;
        config.max_size = 6;
        const json once = stripOrFail(makeNotebook(cells), config);
        REQUIRE(stripOrFail(once, config) == once);
    }
}

TEST_CASE("init cells", "[strip]")
{
    json cells = json::parse(kMixedCells);
    cells[1]["metadata"]["init_cell"] = true;
    cells[1]["metadata"]["keep_output"] = false;

    SECTION("Kept regardless of keep_output")
    {
        const json stripped = stripOrFail(makeNotebook(cells), StripConfig{});
        REQUIRE(stripped["cells"][1]["outputs"].size() == 2);
    }

    SECTION("Stripped with strip_init_cells")
    {
        StripConfig config;
        config.strip_init_cells = true;
        const json stripped = stripOrFail(makeNotebook(cells), config);
        REQUIRE(stripped["cells"][1]["outputs"].empty());
    }
}

TEST_CASE("Contradicting metadata fails the notebook", "[strip]")
{
    json cells = json::parse(kMixedCells);
    cells[2]["metadata"]["keep_output"] = false;
    cells[2]["id"] = "c0ffee";

    auto result = stripCellFormat(makeNotebook(cells), StripConfig{});

    REQUIRE_FALSE(result);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->cell_index == 2);
    REQUIRE_FALSE(result.error->worksheet.has_value());
    REQUIRE(result.error->cell_id == std::optional<std::string>("c0ffee"));
    REQUIRE(result.error->message().find("cell 2, id c0ffee") != std::string::npos);

    SECTION("Metadata true with the tag is fine")
    {
        cells[2]["metadata"]["keep_output"] = true;
        REQUIRE(stripCellFormat(makeNotebook(cells), StripConfig{}));
    }
}

TEST_CASE("Extra keys", "[strip]")
{
    json metadata = json::parse(R"({"signature": "sha256:abc", "widgets": {"state": {}}, "kernelspec": {"name": "python3"}})");

    StripConfig config;
    config.extra_keys = config::defaultExtraKeys();
    config.extra_keys.push_back("metadata.kernelspec.name");
    config.extra_keys.push_back("cell.metadata.tags");

    const json stripped = stripOrFail(makeNotebook(json::parse(kMixedCells), metadata), config);

    REQUIRE(stripped["metadata"] == json::parse(R"({"kernelspec": {}})"));
    REQUIRE(stripped["cells"][1]["metadata"].empty());
    REQUIRE(stripped["cells"][2]["metadata"].empty());
    // Retention is decided before the tags are removed
    REQUIRE(stripped["cells"][2]["outputs"].size() == 1);
}

TEST_CASE("Invalid extra keys are reported and ignored", "[strip]")
{
    std::vector<std::string> warnings;
    WarningContext ctx([&warnings](const std::string& message) { warnings.push_back(message); });

    const auto groups = partitionExtraKeys({ "metadata.a", "cell.b.c", "notebook.x", "plain" }, &ctx);

    REQUIRE(groups.notebook_keys == std::vector<std::string>{ "a" });
    REQUIRE(groups.cell_keys == std::vector<std::string>{ "b.c" });
    REQUIRE(warnings.size() == 2);
    REQUIRE(warnings[0] == "Ignoring invalid extra key `notebook.x`");
    REQUIRE(warnings[1] == "Ignoring invalid extra key `plain`");

    SECTION("Without a context nothing is reported")
    {
        const auto quiet = partitionExtraKeys({ "bogus" });
        REQUIRE(quiet.notebook_keys.empty());
        REQUIRE(quiet.cell_keys.empty());
    }
}

TEST_CASE("Cell dropping happens before stripping", "[strip]")
{
    json cells = json::parse(kMixedCells);
    cells.push_back(json::parse(R"({"cell_type": "code", "metadata": {}, "outputs": [], "source": ["   \n", ""]})"));

    StripConfig config;
    config.drop_empty_cells = true;
    config.drop_tagged_cells = { "keep_output" };

    const json stripped = stripOrFail(makeNotebook(cells), config);

    REQUIRE(stripped["cells"].size() == 2);
    REQUIRE(stripped["cells"][0]["cell_type"] == "markdown");
    REQUIRE(stripped["cells"][1]["source"][0] == "6 * 7");
}

TEST_CASE("Legacy notebooks are stripped per worksheet", "[strip]")
{
    json nb = json::parse(R"({
        "nbformat": 3,
        "nbformat_minor": 0,
        "metadata": {"signature": "sha256:00"},
        "worksheets": [
            {"cells": [
                {"cell_type": "code", "prompt_number": 1, "input": "x", "source": ["x"], "outputs": [{"output_type": "pyout", "text": "1"}], "metadata": {}},
                {"cell_type": "code", "input": "", "source": [], "metadata": {}}
            ]},
            {"cells": [
                {"cell_type": "code", "prompt_number": 4, "source": ["y"], "outputs": [], "metadata": {"keep_output": false, "tags": ["keep_output"]}}
            ]}
        ]
    })");

    StripConfig config;
    config.extra_keys = config::defaultExtraKeys();
    config.drop_empty_cells = true;

    SECTION("Contradiction names the worksheet")
    {
        auto result = stripCellFormat(nb, config);
        REQUIRE_FALSE(result);
        REQUIRE(result.error->worksheet == std::optional<std::size_t>(1));
        REQUIRE(result.error->cell_index == 0);
        REQUIRE(result.error->message().find("cell 0 of worksheet 1") != std::string::npos);
    }

    SECTION("Counters and outputs are cleared")
    {
        nb["worksheets"][1]["cells"][0]["metadata"] = json::object();
        auto result = stripCellFormat(nb, config);
        REQUIRE(result);

        const json& doc = result.document;
        REQUIRE_FALSE(doc["metadata"].contains("signature"));
        REQUIRE(doc["worksheets"][0]["cells"].size() == 1);
        REQUIRE(doc["worksheets"][0]["cells"][0]["prompt_number"].is_null());
        REQUIRE(doc["worksheets"][0]["cells"][0]["outputs"].empty());
        REQUIRE(doc["worksheets"][1]["cells"][0]["prompt_number"].is_null());
    }
}

TEST_CASE("Malformed notebooks throw", "[strip]")
{
    SECTION("Missing metadata")
    {
        json nb = json::parse(R"({"nbformat": 4, "cells": []})");
        REQUIRE_THROWS_AS(stripCellFormat(nb, StripConfig{}), MalformedNotebookError);
    }

    SECTION("Missing cells")
    {
        json nb = json::parse(R"({"nbformat": 4, "metadata": {}})");
        REQUIRE_THROWS_AS(stripCellFormat(nb, StripConfig{}), MalformedNotebookError);
    }

    SECTION("Outputs not a list")
    {
        json nb = makeNotebook(json::parse(R"([{"cell_type": "code", "metadata": {}, "outputs": {}}])"));
        REQUIRE_THROWS_AS(stripCellFormat(nb, StripConfig{}), MalformedNotebookError);
    }

    SECTION("nbformat not an integer")
    {
        json nb = json::parse(R"({"nbformat": "4", "metadata": {}, "cells": []})");
        REQUIRE_THROWS_AS(stripCellFormat(nb, StripConfig{}), MalformedNotebookError);
    }
}
