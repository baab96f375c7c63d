#include <catch2/catch_test_macros.hpp>

#include "strip/OutputSize.hpp"

using nbstripout::outputSize;
using json = nlohmann::json;

TEST_CASE("outputSize measures text", "[output_size]")
{
    REQUIRE(outputSize(json("")) == 0);
    REQUIRE(outputSize(json("hello")) == 5);
    REQUIRE(outputSize(json("日本語")) == 3);
}

TEST_CASE("outputSize sums containers without keys", "[output_size]")
{
    SECTION("Lists of lines")
    {
        REQUIRE(outputSize(json::parse(R"(["ab\n", "cd"])")) == 5);
    }

    SECTION("Objects count values only")
    {
        const json output = json::parse(R"({"output_type": "stream", "name": "stdout", "text": ["hi\n"]})");
        REQUIRE(outputSize(output) == 6 + 6 + 3);
    }

    SECTION("Empty containers")
    {
        REQUIRE(outputSize(json::array()) == 0);
        REQUIRE(outputSize(json::object()) == 0);
    }
}

TEST_CASE("outputSize uses printed length of scalars", "[output_size]")
{
    REQUIRE(outputSize(json(true)) == 4);
    REQUIRE(outputSize(json(false)) == 5);
    REQUIRE(outputSize(json(nullptr)) == 4);
    REQUIRE(outputSize(json(12345)) == 5);
    REQUIRE(outputSize(json(-7)) == 2);
    REQUIRE(outputSize(json::parse(R"({"execution_count": 3, "data": {"text/plain": "42"}})")) == 3);
}
