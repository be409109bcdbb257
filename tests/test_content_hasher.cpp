#include <catch2/catch_test_macros.hpp>
#include "identity/content_hasher.hpp"
#include "core/error.hpp"

using namespace goldminer;

namespace {

IdentityFields carrefour_purchase() {
    return IdentityFields{"2025-11-15", "250.00", "Carrefour Maadi", "hsbc-credit-01",
                          TransactionState::MONETARY};
}

} // anonymous namespace

TEST_CASE("ContentHasher: canonical form", "[hash]") {
    REQUIRE(ContentHasher::canonical_form(carrefour_purchase()) ==
            "2025-11-15|250.00|Carrefour Maadi|hsbc-credit-01|MONETARY");

    auto fields = carrefour_purchase();
    fields.amount = std::nullopt;
    fields.payee = std::nullopt;
    REQUIRE(ContentHasher::canonical_form(fields) == "2025-11-15|||hsbc-credit-01|MONETARY");
}

TEST_CASE("ContentHasher: whitespace does not change identity", "[hash]") {
    auto spaced = carrefour_purchase();
    spaced.payee = "  Carrefour \t  Maadi ";
    spaced.amount = " 250.00";
    REQUIRE(ContentHasher::compute(spaced) == ContentHasher::compute(carrefour_purchase()));
}

TEST_CASE("ContentHasher: every identity field matters", "[hash]") {
    const auto base = ContentHasher::compute(carrefour_purchase());
    REQUIRE(base.size() == 64);
    REQUIRE(base.find_first_not_of("0123456789abcdef") == std::string::npos);

    auto f = carrefour_purchase();
    f.resolved_date = "2025-11-16";
    REQUIRE(ContentHasher::compute(f) != base);

    f = carrefour_purchase();
    f.amount = "250.01";
    REQUIRE(ContentHasher::compute(f) != base);

    f = carrefour_purchase();
    f.account_id = "cib-debit-01";
    REQUIRE(ContentHasher::compute(f) != base);

    f = carrefour_purchase();
    f.state = TransactionState::DECLINED;
    REQUIRE(ContentHasher::compute(f) != base);
}

TEST_CASE("ContentHasher: missing date or account is a programming error", "[hash]") {
    auto f = carrefour_purchase();
    f.resolved_date = " ";
    REQUIRE_THROWS_AS(ContentHasher::compute(f), InvariantViolation);

    f = carrefour_purchase();
    f.account_id.clear();
    REQUIRE_THROWS_AS(ContentHasher::compute(f), InvariantViolation);
}

TEST_CASE("ContentHasher: record identity uses the raw payee", "[hash]") {
    TransactionRecord record;
    record.resolved_date = "2025-11-15";
    record.fields.amount = "250.00";
    record.fields.payee = "Carrefour Maadi";
    record.normalized_merchant = "Carrefour";
    record.account.account_id = "hsbc-credit-01";
    record.transaction_state = TransactionState::MONETARY;

    REQUIRE(ContentHasher::compute(record) == ContentHasher::compute(carrefour_purchase()));

    record.normalized_merchant = "Something Else";
    REQUIRE(ContentHasher::compute(record) == ContentHasher::compute(carrefour_purchase()));
}
