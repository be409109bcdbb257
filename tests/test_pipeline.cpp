#include <catch2/catch_test_macros.hpp>
#include "account/account_resolver.hpp"
#include "anomaly/anomaly_detector.hpp"
#include "categorizer/categorizer.hpp"
#include "categorizer/merchant_resolver.hpp"
#include "classifier/bank_identifier.hpp"
#include "classifier/promo_classifier.hpp"
#include "classifier/transaction_state_classifier.hpp"
#include "config/config_loader.hpp"
#include "core/date_resolver.hpp"
#include "core/pipeline.hpp"
#include "extractor/field_extractor.hpp"
#include "store/memory_transaction_store.hpp"

#include <thread>

using namespace goldminer;
using namespace std::chrono;

namespace {

const std::string kConfigDir = GOLDMINER_CONFIG_DIR;

template<typename T>
T rules_or_fail(Result<T> result) {
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

PipelineBuilder shipped_components() {
    auto promo = std::make_shared<PromoClassifier>(
        rules_or_fail(ConfigLoader::load_promo_keywords(kConfigDir + "/promo_keywords.toml")));
    auto banks = std::make_shared<BankIdentifier>(
        BankIdentifier::Config{},
        rules_or_fail(ConfigLoader::load_bank_patterns(kConfigDir + "/bank_patterns.toml")));
    auto extractor = std::make_shared<FieldExtractor>(
        rules_or_fail(ConfigLoader::load_templates(kConfigDir + "/templates.toml")));
    auto accounts = std::make_shared<AccountResolver>(
        rules_or_fail(ConfigLoader::load_accounts(kConfigDir + "/accounts.toml")));
    auto categorizer = std::make_shared<Categorizer>(
        Categorizer::Config{},
        rules_or_fail(ConfigLoader::load_category_rules(kConfigDir + "/category_rules.toml")));
    auto merchants = std::make_shared<MerchantResolver>(
        MerchantResolver::Config{},
        rules_or_fail(ConfigLoader::load_merchant_aliases(kConfigDir + "/merchant_aliases.toml")));

    PipelineBuilder builder;
    builder.with_promo_classifier(promo)
        .with_bank_identifier(banks)
        .with_field_extractor(extractor)
        .with_account_resolver(accounts)
        .with_state_classifier(std::make_shared<TransactionStateClassifier>())
        .with_categorizer(categorizer)
        .with_merchant_resolver(merchants)
        .with_anomaly_detector(std::make_shared<AnomalyDetector>());
    return builder;
}

std::shared_ptr<Pipeline> make_pipeline(const std::shared_ptr<MemoryTransactionStore>& store) {
    return shipped_components().with_store(store).with_history_provider(store).build();
}

RawMessage sms(std::string text, Timestamp received) {
    return RawMessage{std::move(text), received, std::nullopt};
}

Timestamp nov(unsigned d, int h) {
    return sys_days{year{2025} / 11 / day{d}} + hours{h};
}

const std::string kHsbcCharge =
    "Dear customer, Your HSBC card ending 1234 was charged 250.00 EGP at CARREFOUR EG on 15/11/2025";
const std::string kCibPurchase =
    "CIB: Purchase of EGP 1,250.50 at Starbucks Maadi on 15/11 with card **5678.";
const std::string kCibArabicDebit =
    "تم الخصم من بطاقتك من CIB بمبلغ ٥٠٠ جنيه لدى كارفور";
const std::string kQnbUber =
    "QNB ALAHLI: Purchase of 350 EGP approved at Uber BV with card **9012";
const std::string kHsbcPromo =
    "HSBC: Exclusive offer! Get 20% cashback on all purchases. Limited time only.";
const std::string kHsbcOtp = "Your HSBC verification code is 482913. Do not share it.";
const std::string kCibDeclined = "CIB: Transaction of 300 EGP at Zara was declined.";

std::vector<RawMessage> sample_day() {
    return {
        sms(kHsbcCharge, nov(15, 9)),
        sms(kCibPurchase, nov(15, 10)),
        sms(kCibArabicDebit, nov(15, 11)),
        sms(kQnbUber, nov(15, 12)),
        sms(kHsbcPromo, nov(15, 13)),
        sms(kHsbcOtp, nov(16, 8)),
        sms(kCibDeclined, nov(17, 8)),
    };
}

} // anonymous namespace

// ============================================================================
// Single message
// ============================================================================

TEST_CASE("Pipeline: English card charge", "[pipeline]") {
    auto pipeline = make_pipeline(std::make_shared<MemoryTransactionStore>());
    const auto record = pipeline->process(sms(kHsbcCharge, nov(15, 9)));

    REQUIRE_FALSE(record.promo.skip);
    REQUIRE(record.bank.bank_id == "hsbc");
    REQUIRE(record.bank.match_kind == MatchKind::EXACT);

    REQUIRE(record.fields.amount == "250.00");
    REQUIRE(record.fields.currency == "EGP");
    REQUIRE(record.fields.payee == "CARREFOUR EG");
    REQUIRE(record.fields.date_raw == "15/11/2025");
    REQUIRE(record.fields.card_suffix == "1234");
    REQUIRE(record.fields.confidence == Confidence::HIGH);
    REQUIRE(record.fields.matched_template == "card_charge");

    REQUIRE(record.account.account_id == "hsbc-credit-01");
    REQUIRE(record.account.account_type == AccountType::CREDIT);
    REQUIRE(record.normalized_merchant == "Carrefour");
    REQUIRE(record.category.subcategory == "Groceries");
    REQUIRE(record.category.match_priority == MatchPriority::EXACT);

    REQUIRE(record.transaction_state == TransactionState::MONETARY);
    REQUIRE(record.resolved_date == "2025-11-15");
    REQUIRE_FALSE(record.needs_review);
    REQUIRE(record.content_hash.size() == 64);
    // no history given: anomaly rules do not run
    REQUIRE(record.anomalies.empty());
}

TEST_CASE("Pipeline: Arabic debit with Arabic-Indic digits", "[pipeline]") {
    auto pipeline = make_pipeline(std::make_shared<MemoryTransactionStore>());
    const auto record = pipeline->process(sms(kCibArabicDebit, nov(15, 11)));

    REQUIRE(record.text_repaired);
    REQUIRE_FALSE(record.promo.skip);
    REQUIRE(record.bank.bank_id == "cib");
    REQUIRE(record.fields.matched_template == "arabic_debit");
    REQUIRE(record.fields.amount == "500");
    REQUIRE(record.fields.payee == "كارفور");
    REQUIRE(record.normalized_merchant == "Carrefour");
    REQUIRE(record.category.category == "Food & Dining");
    REQUIRE(record.account.account_id == "unknown");
    REQUIRE(record.transaction_state == TransactionState::MONETARY);
    // no date in the text: the receive time decides
    REQUIRE(record.resolved_date == "2025-11-15");
}

TEST_CASE("Pipeline: promotional message short-circuits", "[pipeline]") {
    auto pipeline = make_pipeline(std::make_shared<MemoryTransactionStore>());
    const auto record = pipeline->process(sms(kHsbcPromo, nov(15, 13)));

    REQUIRE(record.promo.skip);
    REQUIRE(record.transaction_state == TransactionState::PROMO);
    REQUIRE(record.bank.unmatched);
    REQUIRE_FALSE(record.fields.amount.has_value());
    // filtered, not queued for review
    REQUIRE_FALSE(record.needs_review);
    REQUIRE(pipeline->get_stats().low_confidence == 0);
    REQUIRE(record.resolved_date == "2025-11-15");
    REQUIRE_FALSE(record.content_hash.empty());
    REQUIRE(pipeline->get_stats().promo_filtered == 1);
}

TEST_CASE("Pipeline: non-monetary states", "[pipeline]") {
    auto pipeline = make_pipeline(std::make_shared<MemoryTransactionStore>());

    SECTION("OTP") {
        const auto record = pipeline->process(sms(kHsbcOtp, nov(16, 8)));
        REQUIRE(record.transaction_state == TransactionState::OTP);
        REQUIRE(record.bank.bank_id == "hsbc");
        REQUIRE(record.fields.confidence == Confidence::LOW);
        REQUIRE(record.needs_review);
        REQUIRE(record.account.account_id == "unknown");
        REQUIRE_FALSE(record.aggregatable());
    }

    SECTION("declined") {
        const auto record = pipeline->process(sms(kCibDeclined, nov(17, 8)));
        REQUIRE(record.transaction_state == TransactionState::DECLINED);
        REQUIRE_FALSE(record.fields.amount.has_value());
    }
}

TEST_CASE("Pipeline: unknown bank falls back to every template", "[pipeline]") {
    auto pipeline = make_pipeline(std::make_shared<MemoryTransactionStore>());
    const auto record = pipeline->process(
        sms("Your card ending 4444 was charged 75.00 EGP at Pizza Hutt on 14/11/2025", nov(15, 9)));

    REQUIRE(record.bank.unmatched);
    REQUIRE(record.bank.bank_id == "unknown_bank");
    REQUIRE(record.fields.matched_bank == "hsbc");
    REQUIRE(record.fields.amount == "75.00");
    REQUIRE(record.account.account_id == "unknown_4444");
    REQUIRE_FALSE(record.account.is_known);
    REQUIRE_FALSE(record.normalized_merchant.has_value());
    REQUIRE(record.category.subcategory == "Restaurants");
    REQUIRE(record.category.match_priority == MatchPriority::FUZZY);
    REQUIRE(record.resolved_date == "2025-11-14");
    REQUIRE(pipeline->get_stats().unknown_bank == 1);
}

// ============================================================================
// Batches
// ============================================================================

TEST_CASE("Pipeline: batch summary and store outcomes", "[pipeline][store]") {
    auto store = std::make_shared<MemoryTransactionStore>();
    auto pipeline = make_pipeline(store);

    const auto result = pipeline->run_batch(sample_day(), WriteMode::SKIP);
    const auto& s = result.summary;

    REQUIRE(s.processed == 7);
    REQUIRE(s.promo_filtered == 1);
    REQUIRE(s.unknown_bank == 0);
    // OTP and declined; the promo is counted as filtered only
    REQUIRE(s.low_confidence == 2);
    REQUIRE(s.inserted == 6);
    REQUIRE(s.failed == 0);
    REQUIRE(s.by_state.at("MONETARY") == 4);
    REQUIRE(s.by_state.at("PROMO") == 1);
    REQUIRE(s.by_state.at("OTP") == 1);
    REQUIRE(s.by_state.at("DECLINED") == 1);

    REQUIRE(result.records.size() == 7);
    REQUIRE_FALSE(result.outcomes[4].has_value());
    REQUIRE(result.outcomes[0] == WriteOutcome::INSERTED);
    REQUIRE(store->size() == 6);

    // first MONETARY record sees an empty history
    REQUIRE(result.records[0]->anomalies.test(AnomalyFlag::UNKNOWN_MERCHANT));
    // Carrefour again: already seen earlier in the batch
    REQUIRE_FALSE(result.records[2]->anomalies.test(AnomalyFlag::UNKNOWN_MERCHANT));

    SECTION("re-ingesting the same messages is idempotent") {
        const auto again = pipeline->run_batch(sample_day(), WriteMode::SKIP);
        REQUIRE(again.summary.inserted == 0);
        REQUIRE(again.summary.skipped == 6);
        REQUIRE(store->size() == 6);
        for (size_t i = 0; i < result.records.size(); ++i) {
            REQUIRE(again.records[i]->content_hash == result.records[i]->content_hash);
            REQUIRE(again.records[i]->anomalies.names() == result.records[i]->anomalies.names());
        }
    }

    SECTION("upsert mode rewrites existing rows") {
        const auto again = pipeline->run_batch(sample_day(), WriteMode::UPSERT);
        REQUIRE(again.summary.updated == 6);
        REQUIRE(store->size() == 6);
    }
}

TEST_CASE("Pipeline: burst of rides within a day", "[pipeline][anomaly]") {
    auto store = std::make_shared<MemoryTransactionStore>();
    auto pipeline = make_pipeline(store);

    const auto ride = [](int amount, int hour) {
        return sms("QNB ALAHLI: Purchase of " + std::to_string(amount) +
                   " EGP approved at Uber BV with card **9012", nov(20, hour));
    };
    const auto result = pipeline->run_batch({ride(120, 10), ride(95, 11), ride(140, 12)}, WriteMode::SKIP);

    REQUIRE(result.records[0]->anomalies.test(AnomalyFlag::UNKNOWN_MERCHANT));
    REQUIRE(result.records[1]->anomalies.empty());
    REQUIRE(result.records[2]->anomalies.test(AnomalyFlag::BURST_FREQUENCY));
    REQUIRE(result.summary.anomalous == 2);

    // committed rides become history for the next batch
    const auto history = store->history_before(nov(21, 0));
    REQUIRE(history.size() == 3);
    REQUIRE(history.front().payee == "Uber");

    SECTION("re-ingested rides only see rides before them") {
        const auto again = pipeline->run_batch({ride(120, 10), ride(95, 11), ride(140, 12)},
                                               WriteMode::UPSERT);
        REQUIRE(again.summary.updated == 3);
        REQUIRE(again.records[0]->anomalies.test(AnomalyFlag::UNKNOWN_MERCHANT));
        REQUIRE(again.records[1]->anomalies.empty());
        REQUIRE(again.records[2]->anomalies.test(AnomalyFlag::BURST_FREQUENCY));
        REQUIRE(again.summary.anomalous == 2);
    }

    SECTION("a single ride re-processed later keeps its flags") {
        const auto again = pipeline->run_batch({ride(95, 11)}, WriteMode::SKIP);
        REQUIRE(again.outcomes[0] == WriteOutcome::SKIPPED);
        REQUIRE(again.records[0]->content_hash == result.records[1]->content_hash);
        // only the 10:00 ride is before it, and its own row does not count
        REQUIRE(again.records[0]->anomalies.empty());
    }
}

TEST_CASE("Pipeline: date and identity do not depend on processing time", "[pipeline][identity]") {
    auto store = std::make_shared<MemoryTransactionStore>();
    auto pipeline = make_pipeline(store);

    // no date in the text and no timestamps on the message
    const RawMessage undated{kQnbUber, std::nullopt, std::nullopt};

    const auto first = pipeline->process(undated);
    REQUIRE(first.resolved_date == DateResolver::kUnknownDate);
    REQUIRE_FALSE(first.event_time.has_value());

    std::this_thread::sleep_for(milliseconds{20});
    const auto second = make_pipeline(std::make_shared<MemoryTransactionStore>())->process(undated);
    REQUIRE(second.resolved_date == first.resolved_date);
    REQUIRE(second.content_hash == first.content_hash);

    SECTION("a short date without a year source stays unknown") {
        const RawMessage short_date{kCibPurchase, std::nullopt, std::nullopt};
        const auto record = pipeline->process(short_date);
        REQUIRE(record.fields.date_raw == "15/11");
        REQUIRE(record.resolved_date == "unknown");
    }

    SECTION("undated messages are stored once") {
        REQUIRE(pipeline->run_batch({undated}, WriteMode::SKIP).summary.inserted == 1);
        REQUIRE(pipeline->run_batch({undated}, WriteMode::SKIP).summary.skipped == 1);
        REQUIRE(store->size() == 1);
    }
}

TEST_CASE("Pipeline: construction requirements", "[pipeline]") {
    SECTION("run_batch needs a store") {
        auto pipeline = shipped_components().build();
        REQUIRE_THROWS_AS(pipeline->run_batch(sample_day(), WriteMode::SKIP), std::runtime_error);
    }

    SECTION("required components") {
        REQUIRE_THROWS_AS(PipelineBuilder().build(), std::runtime_error);
    }
}
