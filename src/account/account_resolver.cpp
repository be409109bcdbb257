#include "account/account_resolver.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "text/pattern.hpp"
#include "text/text_normalizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace goldminer {

namespace {

// Declaration order is match priority
const std::vector<Pattern>& suffix_patterns() {
    static const std::vector<Pattern> patterns = [] {
        const char* sources[] = {
            R"((?:ending|card ending|ends with)\s+(\d{4})(?!\d))",
            R"(card\s+(?:number\s+)?(?:\*+\s*)?(\d{4})(?!\d))",
            R"(\*+(\d{4})(?!\d))",
            R"((?:رقم|بطاقة رقم|ينتهي)\s+(\d{4})(?!\d))",
            R"((?:بطاقة)\s+(?:\*+\s*)?(\d{4})(?!\d))",
        };
        std::vector<Pattern> compiled;
        for (const char* src : sources) {
            auto result = Pattern::compile(src, /*icase=*/true);
            if (result.is_error()) {
                throw InvariantViolation(std::format("built-in card pattern: {}", result.error_message()));
            }
            compiled.push_back(std::move(result.value()));
        }
        return compiled;
    }();
    return patterns;
}

} // anonymous namespace

AccountResolver::AccountResolver()
    : store_(std::make_shared<Store>()) {}

AccountResolver::AccountResolver(const AccountTable& table)
    : store_(build_store(table)) {}

std::shared_ptr<const AccountResolver::Store> AccountResolver::build_store(const AccountTable& table) {
    auto store = std::make_shared<Store>();
    for (const auto& account : table) {
        if (!account.card_suffix) continue;
        auto entry = account;
        entry.is_known = true;
        store->by_suffix.insert_or_assign(*account.card_suffix, std::move(entry));
    }
    return store;
}

// ============================================================================
// Suffix extraction
// ============================================================================

std::optional<std::string> AccountResolver::extract_card_suffix(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const std::string ascii_digits = TextNormalizer::map_arabic_indic_digits(text);

    for (const auto& pattern : suffix_patterns()) {
        if (auto suffix = pattern.capture(ascii_digits, 1)) {
            return suffix;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

AccountMetadata AccountResolver::unknown_account(const std::string& suffix) {
    AccountMetadata account;
    account.account_id = "unknown_" + suffix;
    account.account_type = AccountType::UNKNOWN;
    account.label = "Unknown card " + suffix;
    account.card_suffix = suffix;
    account.is_known = false;
    return account;
}

AccountMetadata AccountResolver::no_card_account() {
    AccountMetadata account;
    account.account_id = std::string(kNoCardAccountId);
    account.account_type = AccountType::UNKNOWN;
    account.label = "Unknown account";
    account.is_known = false;
    return account;
}

AccountMetadata AccountResolver::lookup_account(const std::string& suffix) const {
    if (suffix.size() != 4 || !utils::is_ascii_digits(suffix)) {
        throw InvariantViolation(std::format("card suffix must be 4 ASCII digits, got '{}'", suffix));
    }

    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    const auto it = store->by_suffix.find(suffix);
    if (it != store->by_suffix.end()) return it->second;

    utils::log::warn(std::format("Unknown card suffix {}, using fallback account", suffix));
    return unknown_account(suffix);
}

AccountMetadata AccountResolver::resolve(const std::optional<std::string>& suffix) const {
    return suffix ? lookup_account(*suffix) : no_card_account();
}

void AccountResolver::load(const AccountTable& table) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&store_, build_store(table), std::memory_order_release);
}

bool AccountResolver::reload_from_file(const std::string& path) {
    return reload_rule_file("accounts", path, ConfigLoader::load_accounts,
        [this](AccountTable table) { load(table); });
}

size_t AccountResolver::account_count() const {
    return std::atomic_load_explicit(&store_, std::memory_order_acquire)->by_suffix.size();
}

} // namespace goldminer
