#pragma once

#include "anomaly/history_provider.hpp"
#include "core/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace goldminer {

struct AnomalyCandidate {
    std::optional<double> amount;
    std::string payee;
    std::optional<Timestamp> timestamp;
};

struct AnomalyReport {
    size_t total = 0;
    size_t anomalous = 0;
    std::map<std::string, size_t> by_rule;
    std::vector<size_t> flagged;   // indices into the evaluated sequence
};

/**
 * @brief Flags unusual transactions against prior history
 *
 * Rules are independent and may fire together:
 *   high_value        amount > percentile of history amounts
 *                     (needs min_history_transactions amounts)
 *   burst_frequency   >= burst_count_threshold same-payee transactions in
 *                     [T - burst_window, T], the current one included
 *   unknown_merchant  payee absent from the last unknown_merchant_window
 *                     history entries
 *
 * History never includes the transaction under evaluation. Payees compare
 * case-insensitively with whitespace collapsed.
 */
class AnomalyDetector {
public:
    struct Config {
        double percentile = 90.0;
        size_t min_history_transactions = 10;
        size_t burst_count_threshold = 3;
        std::chrono::seconds burst_window = std::chrono::hours{24};
        size_t unknown_merchant_window = 100;
        std::set<AnomalyFlag> enabled_rules = {
            AnomalyFlag::HIGH_VALUE, AnomalyFlag::BURST_FREQUENCY, AnomalyFlag::UNKNOWN_MERCHANT};
    };

    AnomalyDetector() : AnomalyDetector(Config{}) {}
    explicit AnomalyDetector(const Config& config);

    [[nodiscard]] AnomalyFlags check(const AnomalyCandidate& candidate,
                                     const History& history) const;

    [[nodiscard]] bool is_high_value(double amount, const History& history) const;
    [[nodiscard]] bool is_burst(const std::string& payee, Timestamp at,
                                const History& history) const;
    [[nodiscard]] bool is_unknown_merchant(const std::string& payee,
                                           const History& history) const;

    /**
     * @brief Evaluate an ordered sequence, each entry against the ones before it
     */
    [[nodiscard]] AnomalyReport report(const History& entries) const;

    /**
     * @brief Linear-interpolated percentile (p in [0, 100]) of values
     */
    [[nodiscard]] static double percentile_of(std::vector<double> values, double p);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] bool enabled(AnomalyFlag flag) const {
        return config_.enabled_rules.contains(flag);
    }

    Config config_;
};

} // namespace goldminer
