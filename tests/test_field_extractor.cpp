#include <catch2/catch_test_macros.hpp>
#include "extractor/field_extractor.hpp"

#include <stdexcept>

using namespace goldminer;

namespace {

ExtractionTemplate make_template(const std::string& bank, const std::string& name,
                                 const std::vector<std::pair<FieldName, std::string>>& patterns,
                                 const std::set<FieldName>& required) {
    ExtractionTemplate tmpl;
    tmpl.bank_id = bank;
    tmpl.name = name;
    for (const auto& [field, source] : patterns) {
        auto compiled = Pattern::compile(source);
        if (compiled.is_error()) throw std::runtime_error(compiled.error_message());
        tmpl.field_patterns.emplace_back(field, std::move(compiled.value()));
    }
    tmpl.required_fields = required;
    return tmpl;
}

const std::string kAmount = R"(charged\s+(?<amount>\d[\d,]*(?:\.\d+)?))";
const std::string kCurrency = R"((?<currency>EGP|USD))";
const std::string kCard = R"(ending\s+(?<card_suffix>\d+))";
const std::string kPayee = R"(\bat\s+(?<payee>.+?)(?:\s+on\s+\d|\.?$))";
const std::string kDate = R"(\bon\s+(?<date>\d{1,2}/\d{1,2}(?:/\d{4})?))";

TemplateSet hsbc_templates() {
    return {{"hsbc", {
        make_template("hsbc", "card_charge",
            {{FieldName::AMOUNT, kAmount}, {FieldName::CURRENCY, kCurrency},
             {FieldName::CARD_SUFFIX, kCard}, {FieldName::PAYEE, kPayee}, {FieldName::DATE, kDate},
             {FieldName::TRANSACTION_TYPE, R"((?<transaction_type>charged|refunded))"}},
            {FieldName::AMOUNT, FieldName::CARD_SUFFIX}),
        make_template("hsbc", "amount_only",
            {{FieldName::AMOUNT, kAmount}},
            {FieldName::AMOUNT}),
    }}};
}

} // anonymous namespace

TEST_CASE("FieldExtractor: first template with all required fields wins", "[extractor]") {
    const FieldExtractor extractor(hsbc_templates());
    const auto fields = extractor.extract(
        "Your HSBC card ending 1234 was charged 1,250.50 EGP at Carrefour Maadi on 15/11/2025",
        SpecifiedBank{"hsbc"});

    REQUIRE(fields.matched_bank == "hsbc");
    REQUIRE(fields.matched_template == "card_charge");
    REQUIRE(fields.confidence == Confidence::HIGH);
    REQUIRE(fields.amount == "1,250.50");
    REQUIRE(fields.currency == "EGP");
    REQUIRE(fields.card_suffix == "1234");
    REQUIRE(fields.payee == "Carrefour Maadi");
    REQUIRE(fields.date_raw == "15/11/2025");
    REQUIRE(fields.transaction_type == "charged");
}

TEST_CASE("FieldExtractor: confidence levels", "[extractor]") {
    SECTION("required met, fewer than half declared -> medium") {
        const FieldExtractor extractor(hsbc_templates());
        // amount + card + type = 3 of 6 declared -> still half -> high
        auto fields = extractor.extract("HSBC card ending 1234 charged 99", SpecifiedBank{"hsbc"});
        REQUIRE(fields.matched_template == "card_charge");
        REQUIRE(fields.confidence == Confidence::HIGH);

        TemplateSet wide = {{"hsbc", {make_template("hsbc", "wide",
            {{FieldName::AMOUNT, kAmount}, {FieldName::CURRENCY, kCurrency},
             {FieldName::PAYEE, kPayee}, {FieldName::DATE, kDate}, {FieldName::CARD_SUFFIX, kCard}},
            {FieldName::AMOUNT})}}};
        const FieldExtractor wide_extractor(std::move(wide));
        fields = wide_extractor.extract("charged 99", SpecifiedBank{"hsbc"});
        REQUIRE(fields.matched_template == "wide");
        REQUIRE(fields.confidence == Confidence::MEDIUM);
    }

    SECTION("a partially matching template is not selected") {
        const FieldExtractor extractor(hsbc_templates());
        // no card suffix: card_charge fails its required set even though it
        // would extract more fields than amount_only
        const auto fields = extractor.extract("HSBC charged 250.00 EGP at Carrefour on 15/11/2025",
                                              SpecifiedBank{"hsbc"});
        REQUIRE(fields.matched_template == "amount_only");
        REQUIRE(fields.amount == "250.00");
        REQUIRE_FALSE(fields.payee.has_value());
        REQUIRE(fields.confidence == Confidence::HIGH);
    }

    SECTION("nothing matches -> low") {
        const FieldExtractor extractor(hsbc_templates());
        const auto fields = extractor.extract("Your statement is ready", SpecifiedBank{"hsbc"});
        REQUIRE(fields.confidence == Confidence::LOW);
        REQUIRE(fields.matched_template.empty());
        REQUIRE_FALSE(fields.amount.has_value());
    }
}

TEST_CASE("FieldExtractor: unmet required fields keep the best partial extraction", "[extractor]") {
    TemplateSet set = {{"hsbc", {
        make_template("hsbc", "needs_card",
            {{FieldName::AMOUNT, kAmount}, {FieldName::CARD_SUFFIX, kCard}},
            {FieldName::AMOUNT, FieldName::CARD_SUFFIX}),
        make_template("hsbc", "needs_currency",
            {{FieldName::AMOUNT, kAmount}, {FieldName::CURRENCY, kCurrency}, {FieldName::PAYEE, kPayee}},
            {FieldName::AMOUNT, FieldName::CURRENCY}),
    }}};
    const FieldExtractor extractor(std::move(set));

    // amount and payee match, currency is missing everywhere
    const auto fields = extractor.extract("charged 250.00 at Carrefour", SpecifiedBank{"hsbc"});
    REQUIRE(fields.confidence == Confidence::LOW);
    REQUIRE(fields.matched_template.empty());
    REQUIRE(fields.matched_bank == "hsbc");
    REQUIRE(fields.amount == "250.00");
    REQUIRE(fields.payee == "Carrefour");
    REQUIRE_FALSE(fields.currency.has_value());

    SECTION("equal partial counts keep the earlier template") {
        const auto amount_only = extractor.extract("charged 40", SpecifiedBank{"hsbc"});
        REQUIRE(amount_only.amount == "40");
        REQUIRE_FALSE(amount_only.payee.has_value());
        REQUIRE(amount_only.confidence == Confidence::LOW);
    }

    SECTION("auto-detect falls back to the partial") {
        const auto detected = extractor.extract("charged 250.00 at Carrefour", AutoDetect{});
        REQUIRE(detected.confidence == Confidence::LOW);
        REQUIRE(detected.amount == "250.00");
        REQUIRE(detected.matched_bank == "hsbc");
    }
}

TEST_CASE("FieldExtractor: malformed card suffix is dropped", "[extractor]") {
    const FieldExtractor extractor(hsbc_templates());
    const auto fields = extractor.extract("card ending 12345 charged 10", SpecifiedBank{"hsbc"});
    REQUIRE_FALSE(fields.card_suffix.has_value());
    REQUIRE(fields.matched_template == "amount_only");
}

TEST_CASE("FieldExtractor: unknown bank id yields low confidence", "[extractor]") {
    const FieldExtractor extractor(hsbc_templates());
    const auto fields = extractor.extract("charged 10", SpecifiedBank{"nobank"});
    REQUIRE(fields.confidence == Confidence::LOW);
    REQUIRE(fields.matched_bank == "nobank");
}

TEST_CASE("FieldExtractor: auto-detect keeps the highest confidence", "[extractor]") {
    TemplateSet set = {
        {"generic", {make_template("generic", "amount_any",
            {{FieldName::AMOUNT, R"((?<amount>\d+(?:\.\d+)?)\s*EGP)"}, {FieldName::PAYEE, kPayee},
             {FieldName::DATE, kDate}},
            {FieldName::AMOUNT})}},
        {"hsbc", hsbc_templates().front().templates},
    };
    const FieldExtractor extractor(std::move(set));

    SECTION("a later bank with higher confidence wins") {
        // generic: amount only (1 of 3) -> medium; hsbc card_charge -> high
        const auto fields = extractor.extract("card ending 1234 charged 250 EGP", AutoDetect{});
        REQUIRE(fields.matched_bank == "hsbc");
        REQUIRE(fields.confidence == Confidence::HIGH);
    }

    SECTION("equal confidence goes to the earlier bank") {
        const auto fields = extractor.extract("charged 250 EGP at Carrefour", AutoDetect{});
        REQUIRE(fields.matched_bank == "generic");
        REQUIRE(fields.confidence == Confidence::HIGH);
    }

    SECTION("no bank matches") {
        const auto fields = extractor.extract("hello", AutoDetect{});
        REQUIRE(fields.confidence == Confidence::LOW);
        REQUIRE(fields.matched_bank.empty());
    }
}

TEST_CASE("FieldExtractor: load replaces templates", "[extractor]") {
    FieldExtractor extractor;
    REQUIRE(extractor.bank_count() == 0);
    REQUIRE(extractor.extract("charged 10", AutoDetect{}).confidence == Confidence::LOW);

    extractor.load(hsbc_templates());
    REQUIRE(extractor.bank_count() == 1);
    REQUIRE(extractor.template_count() == 2);
    REQUIRE(extractor.extract("charged 10", AutoDetect{}).amount == "10");
}
