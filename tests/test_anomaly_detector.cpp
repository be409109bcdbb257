#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "anomaly/anomaly_detector.hpp"
#include "core/date_resolver.hpp"

using namespace goldminer;
using Catch::Approx;
using namespace std::chrono;

namespace {

const Timestamp kNow = sys_days{year{2025} / 11 / 15} + hours{12};

HistoryEntry entry(std::optional<double> amount, std::string payee, Timestamp when) {
    return HistoryEntry{amount, std::move(payee), DateResolver::format_datetime(when)};
}

// Amounts 10, 20, ..., 100 at distinct merchants, days apart
History ten_day_history() {
    History history;
    for (int i = 1; i <= 10; ++i) {
        history.push_back(entry(i * 10.0, "Shop " + std::to_string(i), kNow - days{20 - i}));
    }
    return history;
}

} // anonymous namespace

TEST_CASE("AnomalyDetector: percentile", "[anomaly]") {
    REQUIRE(AnomalyDetector::percentile_of({1, 2, 3, 4}, 50) == Approx(2.5));
    REQUIRE(AnomalyDetector::percentile_of({4, 1, 3, 2}, 100) == Approx(4.0));
    REQUIRE(AnomalyDetector::percentile_of({7}, 90) == Approx(7.0));
    REQUIRE(AnomalyDetector::percentile_of({}, 90) == Approx(0.0));
}

TEST_CASE("AnomalyDetector: high value", "[anomaly]") {
    const AnomalyDetector detector;
    const auto history = ten_day_history();

    // 90th percentile of 10..100 is 91
    REQUIRE(detector.is_high_value(95.0, history));
    REQUIRE_FALSE(detector.is_high_value(90.0, history));
    REQUIRE_FALSE(detector.is_high_value(50.0, history));

    SECTION("an amount equal to the percentile is not flagged") {
        History flat;
        for (int i = 0; i < 10; ++i) flat.push_back(entry(50.0, "Shop", kNow - days{i + 1}));
        REQUIRE_FALSE(detector.is_high_value(50.0, flat));
        REQUIRE(detector.is_high_value(50.5, flat));
    }

    SECTION("too little history never flags") {
        History short_history(history.begin(), history.begin() + 9);
        REQUIRE_FALSE(detector.is_high_value(1e9, short_history));
    }

    SECTION("entries without an amount do not count") {
        auto sparse = history;
        sparse[0].amount = std::nullopt;
        REQUIRE_FALSE(detector.is_high_value(1e9, sparse));
    }
}

TEST_CASE("AnomalyDetector: burst frequency", "[anomaly]") {
    const AnomalyDetector detector;

    History history = {
        entry(50.0, "Uber", kNow - hours{2}),
        entry(40.0, "UBER ", kNow - hours{1}),
    };
    REQUIRE(detector.is_burst("uber", kNow, history));

    SECTION("entries outside the window do not count") {
        history[0] = entry(50.0, "Uber", kNow - hours{25});
        REQUIRE_FALSE(detector.is_burst("Uber", kNow, history));
    }

    SECTION("other payees do not count") {
        REQUIRE_FALSE(detector.is_burst("Careem", kNow, history));
    }

    SECTION("unparseable history dates are skipped") {
        history[0].date = "sometime last week";
        REQUIRE_FALSE(detector.is_burst("Uber", kNow, history));
    }
}

TEST_CASE("AnomalyDetector: unknown merchant", "[anomaly]") {
    AnomalyDetector::Config config;
    config.unknown_merchant_window = 2;
    const AnomalyDetector detector(config);

    const History history = {
        entry(10.0, "Carrefour", kNow - days{3}),
        entry(10.0, "Uber", kNow - days{2}),
        entry(10.0, "Starbucks", kNow - days{1}),
    };

    REQUIRE_FALSE(detector.is_unknown_merchant("uber", history));
    REQUIRE(detector.is_unknown_merchant("Zara", history));
    // only the last two entries are inside the window
    REQUIRE(detector.is_unknown_merchant("Carrefour", history));
    REQUIRE(detector.is_unknown_merchant("Carrefour", History{}));
}

TEST_CASE("AnomalyDetector: check combines independent rules", "[anomaly]") {
    const AnomalyDetector detector;
    auto history = ten_day_history();
    history.push_back(entry(20.0, "Uber", kNow - hours{3}));
    history.push_back(entry(20.0, "Uber", kNow - hours{2}));

    SECTION("several rules at once") {
        const auto flags = detector.check(AnomalyCandidate{500.0, "Uber", kNow}, history);
        REQUIRE(flags.test(AnomalyFlag::HIGH_VALUE));
        REQUIRE(flags.test(AnomalyFlag::BURST_FREQUENCY));
        REQUIRE_FALSE(flags.test(AnomalyFlag::UNKNOWN_MERCHANT));
        REQUIRE(flags.count() == 2);
    }

    SECTION("no payee skips payee rules") {
        const auto flags = detector.check(AnomalyCandidate{10.0, "  ", kNow}, history);
        REQUIRE(flags.empty());
    }

    SECTION("no timestamp skips the burst rule") {
        const auto flags = detector.check(AnomalyCandidate{10.0, "Uber", std::nullopt}, history);
        REQUIRE(flags.empty());
    }

    SECTION("disabled rules never fire") {
        AnomalyDetector::Config config;
        config.enabled_rules = {AnomalyFlag::UNKNOWN_MERCHANT};
        const AnomalyDetector only_unknown(config);
        const auto flags = only_unknown.check(AnomalyCandidate{500.0, "Zara", kNow}, history);
        REQUIRE(flags.names() == std::vector<std::string>{"unknown_merchant"});
    }
}

TEST_CASE("AnomalyDetector: report over a sequence", "[anomaly]") {
    const AnomalyDetector detector;
    const History entries = {
        entry(30.0, "Uber", kNow - hours{3}),
        entry(25.0, "Uber", kNow - hours{2}),
        entry(28.0, "Uber", kNow - hours{1}),
    };

    const auto report = detector.report(entries);
    REQUIRE(report.total == 3);
    // first entry has no history (unknown merchant), third is the third Uber in 24h
    REQUIRE(report.flagged == std::vector<size_t>{0, 2});
    REQUIRE(report.anomalous == 2);
    REQUIRE(report.by_rule.at("unknown_merchant") == 1);
    REQUIRE(report.by_rule.at("burst_frequency") == 1);
}
