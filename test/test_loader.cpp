#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "syllog/input/loader.hpp"
#include <sstream>
#include <string>

using namespace syllog::input;
using syllog::logic::LabelSet;

namespace {

    std::size_t error_line(const std::string &text) {
        try {
            load_relations(text);
        } catch (const ParseError &e) {
            return e.line();
        }
        return 0;
    }

} // namespace

TEST_CASE("Loading relations") {
    SUBCASE("count followed by statements, in order") {
        auto relations = load_relations("2\nPIGS have WINGS\nthings with WINGS can FLY\n");
        REQUIRE(relations.size() == 2);
        CHECK(relations[0].from() == LabelSet{"PIGS"});
        CHECK(relations[1].from() == LabelSet{"WINGS"});
        CHECK(relations[1].to() == LabelSet{"FLY"});
    }

    SUBCASE("from a stream") {
        std::istringstream in("1\nCATS have CLAWS");
        auto relations = load_relations(in);
        REQUIRE(relations.size() == 1);
        CHECK(relations[0].to() == LabelSet{"CLAWS"});
    }

    SUBCASE("CRLF line endings and padded count") {
        auto relations = load_relations("  2 \r\nPIGS have MUD\r\nCOWS have SPOTS\r\n");
        REQUIRE(relations.size() == 2);
        CHECK(relations[0].to() == LabelSet{"MUD"});
        CHECK(relations[1].to() == LabelSet{"SPOTS"});
    }

    SUBCASE("lines after the counted statements are not read") {
        auto relations = load_relations("1\nPIGS have MUD\nthis is not a statement\n");
        CHECK(relations.size() == 1);
    }
}

TEST_CASE("Loader errors") {
    CHECK_THROWS_WITH_AS(load_relations(""), "line 1: missing statement count", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("\n"), "line 1: missing statement count", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("two\n"), "line 1: invalid statement count 'two'", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("2 x\n"), "line 1: invalid statement count '2 x'", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("-1\n"), "line 1: invalid statement count '-1'", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("0\n"), "line 1: statement count must be positive", ParseError);
    CHECK_THROWS_WITH_AS(load_relations("2\nPIGS have WINGS\n"), "line 3: expected 2 statements, found 1",
                         ParseError);

    SUBCASE("a huge count is a truncation error, not an allocation failure") {
        CHECK_THROWS_WITH_AS(load_relations("100000000000000\nPIGS have WINGS\n"),
                             "line 3: expected 100000000000000 statements, found 1", ParseError);
    }

    SUBCASE("a count beyond size_t is rejected") {
        CHECK_THROWS_WITH_AS(load_relations("99999999999999999999999\n"),
                             "line 1: invalid statement count '99999999999999999999999'", ParseError);
    }

    SUBCASE("statement errors report their own line") {
        CHECK(error_line("3\nPIGS have WINGS\nPIGS fly\nCOWS have SPOTS\n") == 3);
        CHECK(error_line("1\n\n") == 2);
    }
}
