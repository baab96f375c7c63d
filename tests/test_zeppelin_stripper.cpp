#include <catch2/catch_test_macros.hpp>

#include "strip/StripResult.hpp"
#include "strip/ZeppelinStripper.hpp"

using nbstripout::stripParagraphFormat;
using ojson = nlohmann::ordered_json;

TEST_CASE("Zeppelin results are cleared", "[zeppelin]")
{
    ojson note = ojson::parse(R"({
        "paragraphs": [
            {"text": "%md hi", "results": {"code": "SUCCESS", "msg": [{"type": "HTML", "data": "<p>hi</p>"}]}, "id": "p1"},
            {"text": "%sh ls", "id": "p2"}
        ],
        "name": "note",
        "id": "2ABC"
    })");

    const ojson stripped = stripParagraphFormat(std::move(note));

    SECTION("Results become an empty object")
    {
        REQUIRE(stripped["paragraphs"][0]["results"] == ojson::object());
    }

    SECTION("Paragraphs without results are left alone")
    {
        REQUIRE_FALSE(stripped["paragraphs"][1].contains("results"));
    }

    SECTION("Key order is preserved")
    {
        auto it = stripped.begin();
        REQUIRE(it.key() == "paragraphs");
        REQUIRE((++it).key() == "name");
        REQUIRE((++it).key() == "id");

        auto p = stripped["paragraphs"][0].begin();
        REQUIRE(p.key() == "text");
        REQUIRE((++p).key() == "results");
        REQUIRE((++p).key() == "id");
    }

    SECTION("Idempotent")
    {
        REQUIRE(stripParagraphFormat(stripped) == stripped);
    }
}

TEST_CASE("Zeppelin notes need paragraphs", "[zeppelin]")
{
    REQUIRE_THROWS_AS(stripParagraphFormat(ojson::parse(R"({"name": "x"})")), nbstripout::MalformedNotebookError);
    REQUIRE_THROWS_AS(stripParagraphFormat(ojson::parse(R"({"paragraphs": {}})")), nbstripout::MalformedNotebookError);
}
