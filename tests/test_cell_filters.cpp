#include <catch2/catch_test_macros.hpp>

#include "strip/CellFilters.hpp"
#include "strip/StripResult.hpp"

using namespace nbstripout;
using json = nlohmann::json;

TEST_CASE("hasNonBlankSource", "[filters]")
{
    REQUIRE(hasNonBlankSource(json::parse(R"({"source": ["", "x = 1"]})")));
    REQUIRE(hasNonBlankSource(json::parse(R"({"source": "print(1)"})")));
    REQUIRE_FALSE(hasNonBlankSource(json::parse(R"({"source": []})")));
    REQUIRE_FALSE(hasNonBlankSource(json::parse(R"({"source": ["  ", "\n", "\t"]})")));
    REQUIRE_FALSE(hasNonBlankSource(json::parse(R"({"source": " \n "})")));
    REQUIRE_FALSE(hasNonBlankSource(json::parse(R"({"cell_type": "code"})")));
    REQUIRE_THROWS_AS(hasNonBlankSource(json::parse(R"({"source": 3})")), MalformedNotebookError);
}

TEST_CASE("Cell filters drop cells and keep order", "[filters]")
{
    json cells = json::parse(R"([
        {"source": ["a"], "metadata": {}},
        {"source": [], "metadata": {}},
        {"source": ["b"], "metadata": {"tags": ["remove"]}},
        {"source": ["c"], "metadata": {"tags": ["hide"]}},
        {"source": ["d"]}
    ])");

    StripConfig config;

    SECTION("No filters configured")
    {
        REQUIRE(buildCellFilters(config).empty());
        applyCellFilters(cells, buildCellFilters(config));
        REQUIRE(cells.size() == 5);
    }

    SECTION("Empty cells")
    {
        config.drop_empty_cells = true;
        applyCellFilters(cells, buildCellFilters(config));
        REQUIRE(cells.size() == 4);
        REQUIRE(cells[1]["source"][0] == "b");
    }

    SECTION("Every tag gets its own filter")
    {
        config.drop_tagged_cells = { "remove", "hide" };
        const auto filters = buildCellFilters(config);
        REQUIRE(filters.size() == 2);

        applyCellFilters(cells, filters);
        REQUIRE(cells.size() == 3);
        REQUIRE(cells[0]["source"][0] == "a");
        REQUIRE(cells[1]["source"].empty());
        REQUIRE(cells[2]["source"][0] == "d");
    }

    SECTION("Both filters")
    {
        config.drop_empty_cells = true;
        config.drop_tagged_cells = { "hide" };
        applyCellFilters(cells, buildCellFilters(config));
        REQUIRE(cells.size() == 3);
        REQUIRE(cells[0]["source"][0] == "a");
        REQUIRE(cells[1]["source"][0] == "b");
        REQUIRE(cells[2]["source"][0] == "d");
    }
}

TEST_CASE("applyCellFilters requires a list", "[filters]")
{
    StripConfig config;
    config.drop_empty_cells = true;
    json cells = json::object();
    REQUIRE_THROWS_AS(applyCellFilters(cells, buildCellFilters(config)), MalformedNotebookError);
}
