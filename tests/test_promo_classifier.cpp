#include <catch2/catch_test_macros.hpp>
#include "classifier/promo_classifier.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace goldminer;

TEST_CASE("PromoClassifier: promotional messages are skipped", "[promo]") {
    const PromoClassifier promo;

    const auto verdict = promo.classify("Exclusive offer! Get 20% cashback. Limited time only.");
    REQUIRE(verdict.skip);
    REQUIRE(verdict.confidence == Confidence::HIGH);
    REQUIRE(verdict.matched_keywords.size() == 4);
    REQUIRE(verdict.reason.find("(and 1 more)") != std::string::npos);
}

TEST_CASE("PromoClassifier: confidence follows keyword count", "[promo]") {
    const PromoClassifier promo(PromoKeywordSet{{"offer", "special offer", "gift"}, {}});

    REQUIRE(promo.classify("A gift for you").confidence == Confidence::LOW);
    REQUIRE(promo.classify("Our special offer").confidence == Confidence::MEDIUM);
    REQUIRE(promo.classify("Special offer: a gift").confidence == Confidence::HIGH);
}

TEST_CASE("PromoClassifier: transactional messages pass", "[promo]") {
    const PromoClassifier promo;

    auto verdict = promo.classify("Your HSBC card ending 1234 was charged 250.00 EGP at Carrefour");
    REQUIRE_FALSE(verdict.skip);
    REQUIRE(verdict.confidence == Confidence::HIGH);
    REQUIRE(verdict.matched_keywords.empty());

    SECTION("Arabic debit wording is not a discount") {
        verdict = promo.classify("تم الخصم من بطاقتك بمبلغ 500 جنيه");
        REQUIRE_FALSE(verdict.skip);
    }

    SECTION("Arabic promo wording") {
        verdict = promo.classify("مبروك! اربح جائزة قيمة");
        REQUIRE(verdict.skip);
        REQUIRE(verdict.confidence == Confidence::HIGH);
    }
}

TEST_CASE("PromoClassifier: empty input", "[promo]") {
    const PromoClassifier promo;
    const auto verdict = promo.classify("   ");
    REQUIRE_FALSE(verdict.skip);
    REQUIRE(verdict.confidence == Confidence::LOW);
    REQUIRE(verdict.reason == "Invalid input");
}

TEST_CASE("PromoClassifier: batch equals single calls", "[promo]") {
    const PromoClassifier promo;
    const std::vector<std::string> messages = {
        "Free voucher inside", "", "Card ending 5678 charged 10 EGP", "عرض خاص لفترة محدودة",
    };
    const auto batch = promo.classify_batch(messages);
    REQUIRE(batch.size() == messages.size());
    for (size_t i = 0; i < messages.size(); ++i) {
        const auto single = promo.classify(messages[i]);
        REQUIRE(batch[i].skip == single.skip);
        REQUIRE(batch[i].confidence == single.confidence);
        REQUIRE(batch[i].matched_keywords == single.matched_keywords);
    }
}

TEST_CASE("PromoClassifier: keyword management", "[promo]") {
    PromoClassifier promo(PromoKeywordSet{{"offer"}, {}});
    REQUIRE_FALSE(promo.is_promotional("Flash clearance today"));

    promo.add_keywords({"clearance"}, {"تصفية"});
    REQUIRE(promo.is_promotional("Flash clearance today"));
    REQUIRE(promo.is_promotional("تصفية شاملة"));

    promo.remove_keywords({"offer"}, {});
    REQUIRE_FALSE(promo.is_promotional("New offer"));
    REQUIRE(promo.keywords().english == std::vector<std::string>{"clearance"});

    promo.reload(PromoKeywordSet{{"offer"}, {}});
    REQUIRE(promo.is_promotional("New offer"));
    REQUIRE_FALSE(promo.is_promotional("Flash clearance today"));
}

TEST_CASE("PromoClassifier: reload from file", "[promo]") {
    PromoClassifier promo(PromoKeywordSet{{"offer"}, {}});

    SECTION("missing file keeps current keywords") {
        REQUIRE_FALSE(promo.reload_from_file("/nonexistent/promo_keywords.toml"));
        REQUIRE(promo.is_promotional("New offer"));
    }

    SECTION("valid file replaces keywords") {
        const auto path = std::filesystem::temp_directory_path() /
            ("promo_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".toml");
        {
            std::ofstream f(path);
            f << "english = [\"raffle\"]\n";
        }
        REQUIRE(promo.reload_from_file(path.string()));
        REQUIRE(promo.is_promotional("Join the raffle"));
        REQUIRE_FALSE(promo.is_promotional("New offer"));
        std::filesystem::remove(path);
    }
}
