#include "categorizer/merchant_resolver.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "text/fuzzy_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace goldminer {

namespace {

std::string fold_key(std::string_view s) {
    return utils::collapse_whitespace(FuzzyMatcher::fold_case(s));
}

} // anonymous namespace

MerchantResolver::MerchantResolver(const Config& config)
    : config_(config), store_(std::make_shared<Store>()) {}

MerchantResolver::MerchantResolver(const Config& config, const MerchantAliasTable& table)
    : config_(config), store_(build_store(table)) {}

std::shared_ptr<const MerchantResolver::Store> MerchantResolver::build_store(
        const MerchantAliasTable& table) {
    auto store = std::make_shared<Store>();
    auto add = [&store](const std::string& alias, const std::string& canonical) {
        auto key = fold_key(alias);
        if (key.empty()) return;
        if (store->alias_to_canonical.emplace(key, canonical).second) {
            store->ordered_aliases.emplace_back(std::move(key), canonical);
        }
    };
    for (const auto& merchant : table) {
        add(merchant.canonical, merchant.canonical);
        for (const auto& alias : merchant.aliases) add(alias, merchant.canonical);
    }
    return store;
}

std::optional<MerchantMatch> MerchantResolver::resolve(std::string_view payee) const {
    const std::string key = fold_key(payee);
    if (key.empty()) return std::nullopt;

    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);

    if (const auto it = store->alias_to_canonical.find(key); it != store->alias_to_canonical.end()) {
        return MerchantMatch{it->second, 100.0, false};
    }

    const std::string* best = nullptr;
    double best_score = 0.0;
    for (const auto& [alias, canonical] : store->ordered_aliases) {
        const double score = FuzzyMatcher::ratio(key, alias);
        if (score >= config_.similarity_threshold && score > best_score) {
            best_score = score;
            best = &canonical;
        }
    }
    if (!best) return std::nullopt;

    utils::log::debug(std::format("Merchant '{}' -> '{}' (score {:.1f})", payee, *best, best_score));
    return MerchantMatch{*best, best_score, true};
}

std::string MerchantResolver::canonical_or_payee(std::string_view payee) const {
    if (auto match = resolve(payee)) return match->canonical;
    return utils::trim(payee);
}

std::vector<std::string> MerchantResolver::all_merchants() const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    std::set<std::string> names;
    for (const auto& [alias, canonical] : store->ordered_aliases) names.insert(canonical);
    return {names.begin(), names.end()};
}

void MerchantResolver::load(const MerchantAliasTable& table) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&store_, build_store(table), std::memory_order_release);
}

bool MerchantResolver::reload_from_file(const std::string& path) {
    return reload_rule_file("merchant_aliases", path, ConfigLoader::load_merchant_aliases,
        [this](MerchantAliasTable table) { load(table); });
}

} // namespace goldminer
