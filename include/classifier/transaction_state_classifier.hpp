#pragma once

#include "core/types.hpp"
#include "text/keyword_matcher.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

struct StateInput {
    std::string_view text;    // normalized message
    bool promo = false;       // Promo Filter fired
    bool has_amount = false;  // extractor found an amount
};

/**
 * @brief Decides a record's monetary relevance
 *
 * Ordered rules, first match wins:
 *   PROMO    promo filter fired
 *   OTP      an OTP keyword is present
 *   DECLINED a declined/refused keyword is present
 *   UNKNOWN  no amount was extracted
 *   MONETARY otherwise
 */
class TransactionStateClassifier {
public:
    struct Config {
        std::vector<std::string> otp_keywords = {
            "otp", "one time password", "verification code", "code",
            "رمز التحقق", "كلمة المرور لمرة واحدة",
        };
        std::vector<std::string> declined_keywords = {
            "declined", "refused", "مرفوضة", "مرفوض", "تم رفض",
        };
    };

    struct Rule {
        TransactionState state;
        std::function<bool(const StateInput&)> applies;
    };

    TransactionStateClassifier() : TransactionStateClassifier(Config{}) {}
    explicit TransactionStateClassifier(const Config& config);

    // Rules capture this
    TransactionStateClassifier(const TransactionStateClassifier&) = delete;
    TransactionStateClassifier& operator=(const TransactionStateClassifier&) = delete;

    [[nodiscard]] TransactionState classify(const StateInput& input) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

private:
    static KeywordMatcher build_matcher(const std::vector<std::string>& keywords);

    KeywordMatcher otp_;
    KeywordMatcher declined_;
    std::vector<Rule> rules_;
};

} // namespace goldminer
