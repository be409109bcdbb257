#include "classifier/bank_identifier.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "text/fuzzy_matcher.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace goldminer {

BankIdentifier::BankIdentifier(const Config& config)
    : config_(config), store_(std::make_shared<Store>()) {}

BankIdentifier::BankIdentifier(const Config& config, const BankPatternTable& table)
    : config_(config), store_(build_store(table)) {}

std::shared_ptr<const BankIdentifier::Store> BankIdentifier::build_store(
        const BankPatternTable& table) {
    auto store = std::make_shared<Store>();
    store->banks.reserve(table.size());

    for (const auto& bank : table) {
        CompiledBank compiled;
        compiled.bank_id = bank.bank_id;
        for (const auto& raw : bank.patterns) {
            CompiledPattern p;
            p.raw = raw;
            auto re = Pattern::compile(raw, /*icase=*/true);
            if (re.is_ok()) {
                p.regex = std::move(re.value());
            } else {
                utils::log::warn(std::format("Bank {}: {}; matching as literal text",
                                              bank.bank_id, re.error_message()));
                p.literal_folded = FuzzyMatcher::fold_case(raw);
            }
            compiled.patterns.push_back(std::move(p));
        }
        store->banks.push_back(std::move(compiled));
    }
    return store;
}

bool BankIdentifier::exact_match(const CompiledPattern& p, std::string_view text,
                                 const std::string& folded_text) {
    if (p.regex) return p.regex->search(text);
    return !p.literal_folded.empty() && folded_text.find(p.literal_folded) != std::string::npos;
}

BankMatch BankIdentifier::identify(std::string_view text) const {
    if (utils::trim(text).empty()) return BankMatch::unknown();

    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    const std::string folded = FuzzyMatcher::fold_case(text);

    // Stage 1: exact, first bank in declaration order wins
    for (const auto& bank : store->banks) {
        for (const auto& p : bank.patterns) {
            if (exact_match(p, text, folded)) {
                BankMatch m;
                m.bank_id = bank.bank_id;
                m.confidence_score = 100;
                m.match_kind = MatchKind::EXACT;
                m.unmatched = false;
                return m;
            }
        }
    }

    if (!config_.enable_fuzzy) return BankMatch::unknown();

    // Stage 2: fuzzy, strict '>' keeps the earliest bank on ties
    const CompiledBank* best_bank = nullptr;
    int best_score = 0;
    for (const auto& bank : store->banks) {
        for (const auto& p : bank.patterns) {
            const int score = static_cast<int>(std::lround(FuzzyMatcher::partial_ratio(p.raw, text)));
            if (score >= config_.fuzzy_threshold && score > best_score) {
                best_score = score;
                best_bank = &bank;
            }
        }
    }

    if (!best_bank) return BankMatch::unknown();

    utils::log::debug(std::format("Fuzzy bank match: {} (score={})", best_bank->bank_id, best_score));
    BankMatch m;
    m.bank_id = best_bank->bank_id;
    m.confidence_score = best_score;
    m.match_kind = MatchKind::FUZZY;
    m.unmatched = false;
    return m;
}

std::vector<BankMatch> BankIdentifier::identify_batch(const std::vector<std::string>& messages) const {
    std::vector<BankMatch> results;
    results.reserve(messages.size());
    for (const auto& msg : messages) {
        results.push_back(identify(msg));
    }
    return results;
}

std::map<std::string, size_t> BankIdentifier::bank_statistics(
        const std::vector<std::string>& messages) const {
    std::map<std::string, size_t> counts;
    for (const auto& match : identify_batch(messages)) {
        ++counts[match.bank_id];
    }
    return counts;
}

void BankIdentifier::load(const BankPatternTable& table) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&store_, build_store(table), std::memory_order_release);
}

bool BankIdentifier::reload_from_file(const std::string& path) {
    return reload_rule_file("bank_patterns", path, ConfigLoader::load_bank_patterns,
        [this](BankPatternTable table) { load(table); });
}

std::vector<std::string> BankIdentifier::bank_ids() const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    std::vector<std::string> ids;
    ids.reserve(store->banks.size());
    for (const auto& bank : store->banks) ids.push_back(bank.bank_id);
    return ids;
}

} // namespace goldminer
