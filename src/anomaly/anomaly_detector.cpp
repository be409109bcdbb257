#include "anomaly/anomaly_detector.hpp"
#include "core/date_resolver.hpp"
#include "text/fuzzy_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace goldminer {

namespace {

std::string payee_key(std::string_view payee) {
    return utils::collapse_whitespace(FuzzyMatcher::fold_case(payee));
}

} // anonymous namespace

AnomalyDetector::AnomalyDetector(const Config& config)
    : config_(config) {}

double AnomalyDetector::percentile_of(std::vector<double> values, double p) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double clamped = std::clamp(p, 0.0, 100.0);
    const double rank = clamped / 100.0 * static_cast<double>(values.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(rank));
    const auto hi = static_cast<size_t>(std::ceil(rank));
    const double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

// ============================================================================
// Rules
// ============================================================================

bool AnomalyDetector::is_high_value(double amount, const History& history) const {
    std::vector<double> amounts;
    amounts.reserve(history.size());
    for (const auto& entry : history) {
        if (entry.amount) amounts.push_back(*entry.amount);
    }
    // Too little history never flags
    if (amounts.size() < config_.min_history_transactions || amounts.empty()) return false;
    return amount > percentile_of(std::move(amounts), config_.percentile);
}

bool AnomalyDetector::is_burst(const std::string& payee, Timestamp at, const History& history) const {
    const std::string key = payee_key(payee);
    const Timestamp window_start = at - config_.burst_window;

    size_t count = 1;  // the current transaction
    for (const auto& entry : history) {
        if (payee_key(entry.payee) != key) continue;
        const auto when = DateResolver::parse_timestamp(entry.date);
        if (!when) {
            utils::log::warn(std::format("Skipping history item with unparseable date '{}' (payee '{}')",
                                          entry.date, entry.payee));
            continue;
        }
        if (*when >= window_start && *when <= at) ++count;
    }
    return count >= config_.burst_count_threshold;
}

bool AnomalyDetector::is_unknown_merchant(const std::string& payee, const History& history) const {
    const std::string key = payee_key(payee);
    const size_t window = std::min(config_.unknown_merchant_window, history.size());
    for (size_t i = history.size() - window; i < history.size(); ++i) {
        if (payee_key(history[i].payee) == key) return false;
    }
    return true;
}

// ============================================================================
// Composition
// ============================================================================

AnomalyFlags AnomalyDetector::check(const AnomalyCandidate& candidate, const History& history) const {
    AnomalyFlags flags;

    if (enabled(AnomalyFlag::HIGH_VALUE) && candidate.amount &&
        is_high_value(*candidate.amount, history)) {
        flags.set(AnomalyFlag::HIGH_VALUE);
    }

    const bool has_payee = !utils::trim(candidate.payee).empty();

    if (enabled(AnomalyFlag::BURST_FREQUENCY) && has_payee && candidate.timestamp &&
        is_burst(candidate.payee, *candidate.timestamp, history)) {
        flags.set(AnomalyFlag::BURST_FREQUENCY);
    }

    if (enabled(AnomalyFlag::UNKNOWN_MERCHANT) && has_payee &&
        is_unknown_merchant(candidate.payee, history)) {
        flags.set(AnomalyFlag::UNKNOWN_MERCHANT);
    }

    return flags;
}

AnomalyReport AnomalyDetector::report(const History& entries) const {
    AnomalyReport out;
    out.total = entries.size();

    History prior;
    prior.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const auto timestamp = DateResolver::parse_timestamp(entry.date);
        if (!timestamp) {
            utils::log::warn(std::format("Entry {} has unparseable date '{}', time rules skipped",
                                          i, entry.date));
        }

        const auto flags = check(AnomalyCandidate{entry.amount, entry.payee, timestamp}, prior);
        if (!flags.empty()) {
            ++out.anomalous;
            out.flagged.push_back(i);
            for (const auto& name : flags.names()) ++out.by_rule[name];
        }
        prior.push_back(entry);
    }
    return out;
}

} // namespace goldminer
