#pragma once

#include "core/types.hpp"
#include "text/keyword_matcher.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

struct PromoKeywordSet {
    std::vector<std::string> english;
    std::vector<std::string> arabic;

    /**
     * @brief Built-in keyword lists used until a rule file is loaded
     */
    static PromoKeywordSet defaults();
};

/**
 * @brief Promo Filter - drops marketing messages before parsing
 *
 * Confidence comes from the number of distinct keywords found:
 * >= 3 high, 2 medium, 1 low. Messages without any keyword are not
 * skipped.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Each
 * classify() call reads one snapshot; keyword edits build a new one.
 */
class PromoClassifier {
public:
    PromoClassifier() : PromoClassifier(PromoKeywordSet::defaults()) {}
    explicit PromoClassifier(PromoKeywordSet keywords);

    [[nodiscard]] PromoVerdict classify(std::string_view text) const;

    [[nodiscard]] bool is_promotional(std::string_view text) const {
        return classify(text).skip;
    }

    [[nodiscard]] std::vector<PromoVerdict> classify_batch(
        const std::vector<std::string>& messages) const;

    /**
     * @brief Replace the active keyword set (RCU swap)
     */
    void reload(PromoKeywordSet keywords);

    /**
     * @brief Reload from a promo keyword TOML file
     * @return false if the file is missing or malformed (previous set kept)
     */
    bool reload_from_file(const std::string& path);

    void add_keywords(const std::vector<std::string>& english,
                      const std::vector<std::string>& arabic);
    void remove_keywords(const std::vector<std::string>& english,
                         const std::vector<std::string>& arabic);

    [[nodiscard]] PromoKeywordSet keywords() const;

private:
    struct Snapshot {
        PromoKeywordSet keywords;
        KeywordMatcher matcher;
    };

    [[nodiscard]] static std::shared_ptr<const Snapshot> build_snapshot(PromoKeywordSet keywords);
    void swap_in(PromoKeywordSet keywords);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
