#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <syllog/syllog.hpp>
#include <string>

using namespace syllog;
using namespace syllog::logic;

namespace {

    std::string verdict_for(const std::string &text, const Query &query = {}, core::ThreadPool *pool = nullptr) {
        SaturationConfig config;
        config.pool = pool;
        Saturation engine(input::load_relations(text), config);
        return describe(engine.evaluate(query), query);
    }

} // namespace

TEST_CASE("End-to-end verdicts") {
    SUBCASE("pigs with wings") {
        CHECK(verdict_for("2\nPIGS have WINGS\nthings with WINGS can FLY\n") == "All pigs can fly");
    }

    SUBCASE("nothing about pigs") { CHECK(verdict_for("1\nCATS have CLAWS\n") == "No pigs can fly"); }

    SUBCASE("some hooved things are flying pigs") {
        CHECK(verdict_for("1\nthings with HOOVES are PIGS with FLY\n") == "Some pigs can fly");
    }

    SUBCASE("direct statement") { CHECK(verdict_for("1\nPIGS can FLY\n") == "All pigs can fly"); }

    SUBCASE("a longer chain") {
        CHECK(verdict_for("4\n"
                          "things with FEATHERS can FLY\n"
                          "things with WINGS have FEATHERS\n"
                          "PIGS have WINGS\n"
                          "COWS have SPOTS\n") == "All pigs can fly");
    }

    SUBCASE("a missing link breaks the chain") {
        CHECK(verdict_for("3\n"
                          "PIGS have WINGS\n"
                          "things with WINGS and FEATHERS can FLY\n"
                          "BIRDS have FEATHERS\n") == "No pigs can fly");
    }

    SUBCASE("premises combined with that can") {
        CHECK(verdict_for("3\n"
                          "PIGS have WINGS\n"
                          "PIGS can FLAP\n"
                          "things with WINGS that can FLAP can FLY\n") == "All pigs can fly");
    }

    SUBCASE("flying pigs derived from another class") {
        CHECK(verdict_for("3\n"
                          "things with HOOVES are PIGS\n"
                          "GOATS have HOOVES\n"
                          "GOATS can FLY\n") == "Some pigs can fly");
    }
}

TEST_CASE("End-to-end custom query") {
    Query query{"COWS", "MOO"};
    CHECK(verdict_for("2\nCOWS have UDDERS\nthings with UDDERS can MOO\n", query) == "All cows can moo");
    CHECK(verdict_for("2\nCOWS have UDDERS\nthings with UDDERS can MOO\n") == "No pigs can fly");
}

TEST_CASE("End-to-end with a thread pool") {
    core::ThreadPool pool(2);
    CHECK(verdict_for("2\nPIGS have WINGS\nthings with WINGS can FLY\n", {}, &pool) == "All pigs can fly");
    CHECK(verdict_for("1\nthings with HOOVES are PIGS with FLY\n", {}, &pool) == "Some pigs can fly");
    CHECK(verdict_for("1\nCATS have CLAWS\n", {}, &pool) == "No pigs can fly");
}

TEST_CASE("Malformed input never yields a verdict") {
    CHECK_THROWS_AS(verdict_for("2\nPIGS have WINGS\n"), input::ParseError);
    CHECK_THROWS_AS(verdict_for("1\nPIGS fly\n"), input::ParseError);
}
