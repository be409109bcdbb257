#include "categorizer/categorizer.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "text/fuzzy_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace goldminer {

namespace {

std::string fold_key(std::string_view s) {
    return utils::collapse_whitespace(FuzzyMatcher::fold_case(s));
}

// Containment of one folded name in the other counts as a strong hit
constexpr double kContainmentScore = 90.0;

} // anonymous namespace

Categorizer::Categorizer(const Config& config)
    : config_(config), store_(build_store(CategoryRuleSet{})) {}

Categorizer::Categorizer(const Config& config, CategoryRuleSet rules)
    : config_(config), store_(build_store(std::move(rules))) {}

std::shared_ptr<const Categorizer::Store> Categorizer::build_store(CategoryRuleSet rules) {
    auto store = std::make_shared<Store>();
    store->compiled.reserve(rules.rules.size());
    for (const auto& rule : rules.rules) {
        CompiledRule compiled;
        for (const auto& name : rule.merchant_exact) {
            auto key = fold_key(name);
            if (!key.empty()) compiled.exact_folded.insert(std::move(key));
        }
        compiled.fuzzy = rule.merchant_fuzzy;
        compiled.keywords = KeywordMatcher(rule.keywords_english, rule.keywords_arabic);
        store->compiled.push_back(std::move(compiled));
    }
    store->rule_set = std::move(rules);
    return store;
}

double Categorizer::merchant_similarity(std::string_view merchant, std::string_view candidate) {
    double score = std::max(FuzzyMatcher::token_sort_ratio(merchant, candidate),
                            FuzzyMatcher::token_set_ratio(merchant, candidate));
    const std::string a = fold_key(merchant);
    const std::string b = fold_key(candidate);
    if (!a.empty() && !b.empty() &&
        (a.find(b) != std::string::npos || b.find(a) != std::string::npos)) {
        score = std::max(score, kContainmentScore);
    }
    return score;
}

// ============================================================================
// Cascade
// ============================================================================

std::vector<Categorizer::Stage> Categorizer::stages(const Store& store) const {
    const double threshold = config_.fuzzy_threshold;
    return {
        {MatchPriority::EXACT, [&store](const CategorizeInput& in) -> std::optional<size_t> {
            const std::string key = fold_key(in.merchant);
            if (key.empty()) return std::nullopt;
            for (size_t i = 0; i < store.compiled.size(); ++i) {
                if (store.compiled[i].exact_folded.contains(key)) return i;
            }
            return std::nullopt;
        }},
        {MatchPriority::FUZZY, [&store, threshold](const CategorizeInput& in) -> std::optional<size_t> {
            if (utils::trim(in.merchant).empty()) return std::nullopt;
            std::optional<size_t> best;
            double best_score = 0.0;
            for (size_t i = 0; i < store.compiled.size(); ++i) {
                for (const auto& candidate : store.compiled[i].fuzzy) {
                    const double score = merchant_similarity(in.merchant, candidate);
                    if (score >= threshold && score > best_score) {
                        best_score = score;
                        best = i;
                    }
                }
            }
            return best;
        }},
        {MatchPriority::KEYWORD, [&store](const CategorizeInput& in) -> std::optional<size_t> {
            const std::string haystack = in.merchant.empty() ? in.text : in.merchant + "\n" + in.text;
            for (size_t i = 0; i < store.compiled.size(); ++i) {
                if (store.compiled[i].keywords.any(haystack)) return i;
            }
            return std::nullopt;
        }},
    };
}

CategoryAssignment Categorizer::categorize(std::string_view merchant, std::string_view text) const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    const CategorizeInput input{std::string(merchant), std::string(text)};

    for (const auto& stage : stages(*store)) {
        if (const auto index = stage.match(input)) {
            const auto& rule = store->rule_set.rules[*index];
            return CategoryAssignment{rule.category, rule.subcategory, rule.tags, stage.priority};
        }
    }

    const auto& fallback = store->rule_set.fallback;
    return CategoryAssignment{fallback.category, fallback.subcategory, fallback.tags,
                              MatchPriority::FALLBACK};
}

std::vector<CategoryAssignment> Categorizer::categorize_batch(
        const std::vector<CategorizeInput>& inputs) const {
    std::vector<CategoryAssignment> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(categorize(input.merchant, input.text));
    }
    return results;
}

CategoryStatistics Categorizer::category_statistics(const std::vector<CategoryAssignment>& assignments) {
    CategoryStatistics stats;
    stats.total = assignments.size();
    for (const auto& a : assignments) {
        ++stats.by_category[a.category];
        ++stats.by_subcategory[a.category][a.subcategory];
        if (a.match_priority == MatchPriority::FALLBACK) ++stats.uncategorized;
    }
    if (stats.total > 0) {
        stats.uncategorized_percentage =
            100.0 * static_cast<double>(stats.uncategorized) / static_cast<double>(stats.total);
    }
    return stats;
}

void Categorizer::load(CategoryRuleSet rules) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&store_, build_store(std::move(rules)), std::memory_order_release);
}

bool Categorizer::reload_from_file(const std::string& path) {
    return reload_rule_file("category_rules", path, ConfigLoader::load_category_rules,
        [this](CategoryRuleSet rules) { load(std::move(rules)); });
}

size_t Categorizer::rule_count() const {
    return std::atomic_load_explicit(&store_, std::memory_order_acquire)->rule_set.rules.size();
}

} // namespace goldminer
