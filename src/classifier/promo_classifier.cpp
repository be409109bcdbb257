#include "classifier/promo_classifier.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace goldminer {

// ============================================================================
// Defaults
// ============================================================================

PromoKeywordSet PromoKeywordSet::defaults() {
    PromoKeywordSet set;
    set.english = {
        "offer", "discount", "sale", "enjoy", "special offer",
        "limited time", "promotion", "promo", "deal", "deals",
        "save", "saving", "cashback", "reward", "rewards",
        "exclusive", "free", "gift", "bonus", "win", "winner",
        "congratulations", "congrats", "voucher", "coupon", "redeem",
    };
    // "خصم" is left out: it means both "discount" and "debit"
    set.arabic = {
        "عرض خاص", "لفترة محدودة", "عروض", "توفير", "مجاني", "هدية",
        "مكافأة", "مكافآت", "حصري", "خصومات", "استمتع", "تخفيض",
        "تخفيضات", "كاش باك", "قسيمة", "كوبون", "مبروك", "فائز",
        "اربح", "جائزة", "وفر الآن", "احصل على", "فرصة",
    };
    return set;
}

// ============================================================================
// PromoClassifier
// ============================================================================

PromoClassifier::PromoClassifier(PromoKeywordSet keywords)
    : snapshot_(build_snapshot(std::move(keywords))) {}

std::shared_ptr<const PromoClassifier::Snapshot> PromoClassifier::build_snapshot(
        PromoKeywordSet keywords) {
    auto snap = std::make_shared<Snapshot>();
    snap->matcher = KeywordMatcher(keywords.english, keywords.arabic);
    snap->keywords = std::move(keywords);
    return snap;
}

void PromoClassifier::swap_in(PromoKeywordSet keywords) {
    auto snap = build_snapshot(std::move(keywords));
    std::atomic_store_explicit(&snapshot_, std::move(snap), std::memory_order_release);
}

PromoVerdict PromoClassifier::classify(std::string_view text) const {
    PromoVerdict verdict;
    if (utils::trim(text).empty()) {
        verdict.skip = false;
        verdict.reason = "Invalid input";
        verdict.confidence = Confidence::LOW;
        return verdict;
    }

    const auto snap = std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
    verdict.matched_keywords = snap->matcher.find_all(text);

    if (verdict.matched_keywords.empty()) {
        verdict.skip = false;
        verdict.reason = "No promotional keywords detected";
        verdict.confidence = Confidence::HIGH;
        return verdict;
    }

    const size_t hits = verdict.matched_keywords.size();
    verdict.skip = true;
    verdict.confidence = hits >= 3 ? Confidence::HIGH
                       : hits == 2 ? Confidence::MEDIUM
                                   : Confidence::LOW;

    std::string listed;
    for (size_t i = 0; i < std::min<size_t>(hits, 3); ++i) {
        if (i > 0) listed += ", ";
        listed += verdict.matched_keywords[i];
    }
    if (hits > 3) listed += std::format(" (and {} more)", hits - 3);
    verdict.reason = std::format("Promotional message detected (keywords: {})", listed);
    return verdict;
}

std::vector<PromoVerdict> PromoClassifier::classify_batch(
        const std::vector<std::string>& messages) const {
    std::vector<PromoVerdict> results;
    results.reserve(messages.size());
    size_t promotional = 0;
    for (const auto& msg : messages) {
        results.push_back(classify(msg));
        if (results.back().skip) ++promotional;
    }
    utils::log::debug(std::format("Promo batch: {} messages, {} promotional",
                                   messages.size(), promotional));
    return results;
}

void PromoClassifier::reload(PromoKeywordSet keywords) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    swap_in(std::move(keywords));
}

bool PromoClassifier::reload_from_file(const std::string& path) {
    return reload_rule_file("promo_keywords", path, ConfigLoader::load_promo_keywords,
        [this](PromoKeywordSet keywords) { reload(std::move(keywords)); });
}

void PromoClassifier::add_keywords(const std::vector<std::string>& english,
                                   const std::vector<std::string>& arabic) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto current = std::atomic_load_explicit(&snapshot_, std::memory_order_acquire)->keywords;
    current.english.insert(current.english.end(), english.begin(), english.end());
    current.arabic.insert(current.arabic.end(), arabic.begin(), arabic.end());
    swap_in(std::move(current));
    utils::log::info(std::format("Added {} English and {} Arabic promo keywords",
                                  english.size(), arabic.size()));
}

void PromoClassifier::remove_keywords(const std::vector<std::string>& english,
                                      const std::vector<std::string>& arabic) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto current = std::atomic_load_explicit(&snapshot_, std::memory_order_acquire)->keywords;
    auto drop = [](std::vector<std::string>& from, const std::vector<std::string>& gone) {
        std::erase_if(from, [&gone](const std::string& kw) {
            return std::find(gone.begin(), gone.end(), kw) != gone.end();
        });
    };
    drop(current.english, english);
    drop(current.arabic, arabic);
    swap_in(std::move(current));
    utils::log::info(std::format("Removed {} English and {} Arabic promo keywords",
                                  english.size(), arabic.size()));
}

PromoKeywordSet PromoClassifier::keywords() const {
    return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire)->keywords;
}

} // namespace goldminer
