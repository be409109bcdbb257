#include <catch2/catch_test_macros.hpp>
#include "categorizer/merchant_resolver.hpp"

using namespace goldminer;

namespace {

MerchantAliasTable test_aliases() {
    return {
        {"Carrefour", {"CARREFOUR EG", "Carrefour Egypt", "كارفور"}},
        {"Uber", {"UBER TRIP", "Uber BV"}},
    };
}

} // anonymous namespace

TEST_CASE("MerchantResolver: exact alias lookup", "[merchant]") {
    const MerchantResolver resolver(MerchantResolver::Config{}, test_aliases());

    auto match = resolver.resolve("carrefour eg");
    REQUIRE(match.has_value());
    REQUIRE(match->canonical == "Carrefour");
    REQUIRE(match->score == 100.0);
    REQUIRE_FALSE(match->fuzzy);

    REQUIRE(resolver.resolve("  Carrefour   Egypt ")->canonical == "Carrefour");
    REQUIRE(resolver.resolve("كارفور")->canonical == "Carrefour");
    REQUIRE(resolver.resolve("UBER")->canonical == "Uber");
}

TEST_CASE("MerchantResolver: fuzzy alias lookup", "[merchant]") {
    const MerchantResolver resolver(MerchantResolver::Config{}, test_aliases());

    const auto match = resolver.resolve("Carefour Egypt");
    REQUIRE(match.has_value());
    REQUIRE(match->canonical == "Carrefour");
    REQUIRE(match->fuzzy);
    REQUIRE(match->score >= 85.0);

    SECTION("threshold is configurable") {
        const MerchantResolver strict(MerchantResolver::Config{99.0}, test_aliases());
        REQUIRE_FALSE(strict.resolve("Carefour Egypt").has_value());
    }
}

TEST_CASE("MerchantResolver: unresolved payees", "[merchant]") {
    const MerchantResolver resolver(MerchantResolver::Config{}, test_aliases());

    REQUIRE_FALSE(resolver.resolve("Zara").has_value());
    REQUIRE_FALSE(resolver.resolve("   ").has_value());
    REQUIRE(resolver.canonical_or_payee(" Zara ") == "Zara");
    REQUIRE(resolver.canonical_or_payee("UBER TRIP") == "Uber");
}

TEST_CASE("MerchantResolver: merchants and reload", "[merchant]") {
    MerchantResolver resolver;
    REQUIRE(resolver.all_merchants().empty());

    resolver.load(test_aliases());
    REQUIRE(resolver.all_merchants() == std::vector<std::string>{"Carrefour", "Uber"});

    resolver.load({{"Starbucks", {"STARBUCKS COFFEE"}}});
    REQUIRE(resolver.all_merchants() == std::vector<std::string>{"Starbucks"});
    REQUIRE_FALSE(resolver.resolve("CARREFOUR EG").has_value());
}
