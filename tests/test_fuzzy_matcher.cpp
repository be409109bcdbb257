#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "text/fuzzy_matcher.hpp"

using namespace goldminer;
using Catch::Approx;

TEST_CASE("FuzzyMatcher: ratio", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::ratio("carrefour", "carrefour") == Approx(100.0));
    REQUIRE(FuzzyMatcher::ratio("Carrefour", "CARREFOUR") == Approx(100.0));
    // LCS("abcd", "abce") = 3 -> 2*3/8
    REQUIRE(FuzzyMatcher::ratio("abcd", "abce") == Approx(75.0));
    REQUIRE(FuzzyMatcher::ratio("", "abc") == Approx(0.0));
    REQUIRE(FuzzyMatcher::ratio("!!!", "abc") == Approx(0.0));
}

TEST_CASE("FuzzyMatcher: punctuation is ignored", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::ratio("McDonald's", "mcdonald s") == Approx(100.0));
    REQUIRE(FuzzyMatcher::process("  Uber*Trip ") == U"uber trip");
}

TEST_CASE("FuzzyMatcher: partial_ratio finds the best window", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::partial_ratio("HSBC", "Your HSBC card was charged") == Approx(100.0));
    REQUIRE(FuzzyMatcher::partial_ratio("Your HSBC card was charged", "HSBC") == Approx(100.0));
    REQUIRE(FuzzyMatcher::partial_ratio("zzzz", "Your HSBC card") < 50.0);
}

TEST_CASE("FuzzyMatcher: token_sort_ratio ignores word order", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::token_sort_ratio("Maadi Carrefour", "Carrefour Maadi") == Approx(100.0));
    REQUIRE(FuzzyMatcher::ratio("Maadi Carrefour", "Carrefour Maadi") < 100.0);
}

TEST_CASE("FuzzyMatcher: token_set_ratio tolerates extra tokens", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::token_set_ratio("Carrefour", "Carrefour City Centre Maadi") == Approx(100.0));
    REQUIRE(FuzzyMatcher::token_set_ratio("Uber", "Careem") < 50.0);
}

TEST_CASE("FuzzyMatcher: Arabic compares by code point", "[fuzzy]") {
    REQUIRE(FuzzyMatcher::ratio("كارفور", "كارفور") == Approx(100.0));
    // one of six letters differs
    REQUIRE(FuzzyMatcher::ratio("كارفور", "كارفوز") == Approx(200.0 * 5 / 12));
    REQUIRE(FuzzyMatcher::fold_case("CAFÉ") == "café");
}
