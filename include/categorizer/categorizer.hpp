#pragma once

#include "core/types.hpp"
#include "text/keyword_matcher.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

struct CategoryRule {
    std::string category;
    std::string subcategory;
    std::set<std::string> tags;
    std::vector<std::string> merchant_exact;
    std::vector<std::string> merchant_fuzzy;
    std::vector<std::string> keywords_english;
    std::vector<std::string> keywords_arabic;
};

struct CategoryFallback {
    std::string category = "Uncategorized";
    std::string subcategory = "General";
    std::set<std::string> tags;
};

struct CategoryRuleSet {
    std::vector<CategoryRule> rules;
    CategoryFallback fallback;
};

struct CategorizeInput {
    std::string merchant;   // canonical merchant or raw payee, may be empty
    std::string text;       // normalized message
};

struct CategoryStatistics {
    size_t total = 0;
    std::map<std::string, size_t> by_category;
    std::map<std::string, std::map<std::string, size_t>> by_subcategory;
    size_t uncategorized = 0;
    double uncategorized_percentage = 0.0;
};

/**
 * @brief Assigns category/subcategory/tags through a priority cascade
 *
 *   EXACT     merchant equals a configured merchant (case-insensitive)
 *   FUZZY     best of token-sort / token-set similarity >= threshold
 *   KEYWORD   bilingual keyword present in merchant or message text
 *   FALLBACK  configured default category
 *
 * The first stage that yields an assignment wins. Inside a stage, rules
 * are tried in declaration order (fuzzy keeps the best score, earlier
 * rule on ties).
 *
 * Thread-safety: rule set is an immutable snapshot swapped atomically.
 */
class Categorizer {
public:
    struct Config {
        double fuzzy_threshold = 80.0;
    };

    struct Stage {
        MatchPriority priority;
        std::function<std::optional<size_t>(const CategorizeInput&)> match;   // rule index
    };

    Categorizer() : Categorizer(Config{}) {}
    explicit Categorizer(const Config& config);
    Categorizer(const Config& config, CategoryRuleSet rules);

    [[nodiscard]] CategoryAssignment categorize(std::string_view merchant,
                                                std::string_view text) const;

    [[nodiscard]] std::vector<CategoryAssignment> categorize_batch(
        const std::vector<CategorizeInput>& inputs) const;

    [[nodiscard]] static CategoryStatistics category_statistics(
        const std::vector<CategoryAssignment>& assignments);

    /**
     * @brief Fuzzy score used by the FUZZY stage (0-100)
     */
    [[nodiscard]] static double merchant_similarity(std::string_view merchant,
                                                    std::string_view candidate);

    void load(CategoryRuleSet rules);
    bool reload_from_file(const std::string& path);

    [[nodiscard]] size_t rule_count() const;

private:
    struct CompiledRule {
        std::set<std::string> exact_folded;
        std::vector<std::string> fuzzy;
        KeywordMatcher keywords;
    };

    struct Store {
        CategoryRuleSet rule_set;
        std::vector<CompiledRule> compiled;
    };

    [[nodiscard]] static std::shared_ptr<const Store> build_store(CategoryRuleSet rules);

    [[nodiscard]] std::vector<Stage> stages(const Store& store) const;

    Config config_;
    std::atomic<std::shared_ptr<const Store>> store_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
