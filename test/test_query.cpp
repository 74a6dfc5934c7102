#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "syllog/logic/query.hpp"
#include <string>

using namespace syllog::logic;

TEST_CASE("Verdict lines for the default query") {
    CHECK(describe(Verdict::All) == "All pigs can fly");
    CHECK(describe(Verdict::Some) == "Some pigs can fly");
    CHECK(describe(Verdict::None) == "No pigs can fly");
}

TEST_CASE("Verdict lines lower-case custom labels") {
    Query query{"COWS", "Moo"};
    CHECK(describe(Verdict::All, query) == "All cows can moo");
    CHECK(describe(Verdict::None, query) == "No cows can moo");
}

TEST_CASE("Verdict names") {
    CHECK(std::string(to_string(Verdict::All)) == "all");
    CHECK(std::string(to_string(Verdict::Some)) == "some");
    CHECK(std::string(to_string(Verdict::None)) == "none");
}
