#include <catch2/catch_test_macros.hpp>
#include "account/account_resolver.hpp"
#include "core/error.hpp"

using namespace goldminer;

namespace {

AccountTable test_accounts() {
    AccountMetadata credit;
    credit.card_suffix = "1234";
    credit.account_id = "hsbc-credit-01";
    credit.account_type = AccountType::CREDIT;
    credit.interest_rate = 22.5;
    credit.credit_limit = 50000.0;
    credit.billing_cycle = 25;
    credit.label = "HSBC Platinum";

    AccountMetadata debit;
    debit.card_suffix = "5678";
    debit.account_id = "cib-debit-01";
    debit.account_type = AccountType::DEBIT;
    debit.label = "CIB Payroll";

    return {credit, debit};
}

} // anonymous namespace

TEST_CASE("AccountResolver: extract_card_suffix", "[account]") {
    SECTION("English patterns") {
        REQUIRE(AccountResolver::extract_card_suffix("Your card ending 1234 was charged") == "1234");
        REQUIRE(AccountResolver::extract_card_suffix("Card ENDS WITH 4321") == "4321");
        REQUIRE(AccountResolver::extract_card_suffix("Purchase with card **5678 approved") == "5678");
        REQUIRE(AccountResolver::extract_card_suffix("Card number 9012 used") == "9012");
        REQUIRE(AccountResolver::extract_card_suffix("Paid using ****3456") == "3456");
    }

    SECTION("Arabic patterns, Arabic-Indic digits included") {
        REQUIRE(AccountResolver::extract_card_suffix("تم الخصم من بطاقة رقم 1234") == "1234");
        REQUIRE(AccountResolver::extract_card_suffix("بطاقة رقم ٥٦٧٨") == "5678");
        REQUIRE(AccountResolver::extract_card_suffix("بطاقتك ينتهي 9012") == "9012");
    }

    SECTION("five or more digits never yield a suffix") {
        REQUIRE_FALSE(AccountResolver::extract_card_suffix("card ending 12345").has_value());
        REQUIRE_FALSE(AccountResolver::extract_card_suffix("ref ****123456").has_value());
    }

    SECTION("no suffix") {
        REQUIRE_FALSE(AccountResolver::extract_card_suffix("Your statement is ready").has_value());
        REQUIRE_FALSE(AccountResolver::extract_card_suffix("").has_value());
    }
}

TEST_CASE("AccountResolver: lookup_account", "[account]") {
    const AccountResolver resolver(test_accounts());

    SECTION("known suffix") {
        const auto account = resolver.lookup_account("1234");
        REQUIRE(account.account_id == "hsbc-credit-01");
        REQUIRE(account.account_type == AccountType::CREDIT);
        REQUIRE(account.interest_rate == 22.5);
        REQUIRE(account.billing_cycle == 25);
        REQUIRE(account.is_known);
    }

    SECTION("unknown suffix synthesizes a fallback") {
        const auto account = resolver.lookup_account("0000");
        REQUIRE(account.account_id == "unknown_0000");
        REQUIRE(account.account_type == AccountType::UNKNOWN);
        REQUIRE_FALSE(account.is_known);
        REQUIRE_FALSE(account.interest_rate.has_value());
        REQUIRE_FALSE(account.credit_limit.has_value());
        REQUIRE_FALSE(account.billing_cycle.has_value());
    }

    SECTION("malformed suffix is a caller bug") {
        REQUIRE_THROWS_AS(resolver.lookup_account("12a4"), InvariantViolation);
        REQUIRE_THROWS_AS(resolver.lookup_account("123"), InvariantViolation);
    }
}

TEST_CASE("AccountResolver: resolve without a suffix", "[account]") {
    const AccountResolver resolver(test_accounts());
    const auto account = resolver.resolve(std::nullopt);
    REQUIRE(account.account_id == "unknown");
    REQUIRE_FALSE(account.is_known);
    REQUIRE(resolver.resolve(std::string("5678")).account_id == "cib-debit-01");
}

TEST_CASE("AccountResolver: load swaps the table", "[account]") {
    AccountResolver resolver;
    REQUIRE(resolver.account_count() == 0);
    REQUIRE_FALSE(resolver.lookup_account("1234").is_known);

    resolver.load(test_accounts());
    REQUIRE(resolver.account_count() == 2);
    REQUIRE(resolver.lookup_account("1234").is_known);
}
