#include "classifier/transaction_state_classifier.hpp"

#include <algorithm>

namespace goldminer {

namespace {

bool is_ascii(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

} // anonymous namespace

KeywordMatcher TransactionStateClassifier::build_matcher(const std::vector<std::string>& keywords) {
    std::vector<std::string> english;
    std::vector<std::string> other;
    for (const auto& kw : keywords) {
        (is_ascii(kw) ? english : other).push_back(kw);
    }
    return KeywordMatcher(english, other);
}

TransactionStateClassifier::TransactionStateClassifier(const Config& config)
    : otp_(build_matcher(config.otp_keywords)),
      declined_(build_matcher(config.declined_keywords)) {
    rules_ = {
        {TransactionState::PROMO,    [](const StateInput& in) { return in.promo; }},
        {TransactionState::OTP,      [this](const StateInput& in) { return otp_.any(in.text); }},
        {TransactionState::DECLINED, [this](const StateInput& in) { return declined_.any(in.text); }},
        {TransactionState::UNKNOWN,  [](const StateInput& in) { return !in.has_amount; }},
    };
}

TransactionState TransactionStateClassifier::classify(const StateInput& input) const {
    for (const auto& rule : rules_) {
        if (rule.applies(input)) return rule.state;
    }
    return TransactionState::MONETARY;
}

} // namespace goldminer
