#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "text/pattern.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <set>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace goldminer {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Missing key -> empty; anything but an array of strings -> nullopt
std::optional<std::vector<std::string>> string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    const auto node = tbl[key];
    if (!node) return result;
    const auto* arr = node.as_array();
    if (!arr) return std::nullopt;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* s = elem.as_string();
        if (!s) return std::nullopt;
        result.emplace_back(s->get());
    }
    return result;
}

std::vector<std::string> string_array_or_throw(const toml::table& tbl, std::string_view key,
                                               std::string_view section) {
    auto values = string_array(tbl, key);
    if (!values) {
        throw std::runtime_error(std::format("{}.{} must be an array of strings", section, key));
    }
    return std::move(*values);
}

// Reads a rule file, mapping a missing file and TOML errors to categories
template<typename T, typename From>
Result<T> load_rule_file(const std::string& path, From&& from) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<T>::error(ErrorCategory::CONFIG_NOT_FOUND,
                                std::format("Rule file not found: {}", path));
    }
    try {
        const auto tbl = toml::parse_file(path);
        auto result = from(tbl);
        if (result.is_error()) {
            return Result<T>::error(result.error_category(),
                                    std::format("{}: {}", path, result.error_message()));
        }
        return result;
    } catch (const std::exception& e) {
        return Result<T>::error(ErrorCategory::CONFIG_MALFORMED,
                                std::format("{}: {}", path, e.what()));
    }
}

template<typename T, typename From>
Result<T> parse_rule_string(const std::string& content, From&& from) {
    try {
        return from(toml::parse(content));
    } catch (const std::exception& e) {
        return Result<T>::error(ErrorCategory::CONFIG_MALFORMED, e.what());
    }
}

template<typename T>
Result<T> malformed(std::string message) {
    return Result<T>::error(ErrorCategory::CONFIG_MALFORMED, std::move(message));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<WriteMode> ConfigLoader::parse_store_mode(const std::string& mode_str) {
    return parse_write_mode(utils::to_lower(mode_str));
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

BankIdentifier::Config ConfigLoader::extract_bank_identifier(const toml::table& root) {
    BankIdentifier::Config cfg;
    const auto* bank = root["bank_identifier"].as_table();
    if (!bank) return cfg;

    cfg.fuzzy_threshold = (*bank)["fuzzy_threshold"].value_or(80);
    cfg.enable_fuzzy = (*bank)["enable_fuzzy"].value_or(true);
    return cfg;
}

Categorizer::Config ConfigLoader::extract_categorizer(const toml::table& root) {
    Categorizer::Config cfg;
    const auto* cat = root["categorizer"].as_table();
    if (!cat) return cfg;

    cfg.fuzzy_threshold = (*cat)["fuzzy_threshold"].value_or(80.0);
    return cfg;
}

MerchantResolver::Config ConfigLoader::extract_merchant_resolver(const toml::table& root) {
    MerchantResolver::Config cfg;
    const auto* merchant = root["merchant_resolver"].as_table();
    if (!merchant) return cfg;

    cfg.similarity_threshold = (*merchant)["similarity_threshold"].value_or(85.0);
    return cfg;
}

AnomalyDetector::Config ConfigLoader::extract_anomaly(const toml::table& root) {
    AnomalyDetector::Config cfg;
    const auto* anomaly = root["anomaly"].as_table();
    if (!anomaly) return cfg;
    const auto& a = *anomaly;

    cfg.percentile = a["percentile"].value_or(90.0);
    cfg.min_history_transactions = static_cast<size_t>(a["min_history_transactions"].value_or(10));
    cfg.burst_count_threshold = static_cast<size_t>(a["burst_count_threshold"].value_or(3));
    cfg.burst_window = std::chrono::seconds(
        static_cast<int64_t>(a["burst_window_hours"].value_or(24.0) * 3600.0));
    cfg.unknown_merchant_window = static_cast<size_t>(a["unknown_merchant_window"].value_or(100));

    if (a["enabled_rules"]) {
        cfg.enabled_rules.clear();
        for (const auto& name : string_array_or_throw(a, "enabled_rules", "anomaly")) {
            const auto flag = parse_anomaly_flag(name);
            if (!flag) {
                throw std::runtime_error(std::format("anomaly.enabled_rules: unknown rule '{}'", name));
            }
            cfg.enabled_rules.insert(*flag);
        }
    }
    return cfg;
}

TransactionStateClassifier::Config ConfigLoader::extract_transaction_state(const toml::table& root) {
    TransactionStateClassifier::Config cfg;
    const auto* state = root["transaction_state"].as_table();
    if (!state) return cfg;

    if ((*state)["otp_keywords"]) {
        cfg.otp_keywords = string_array_or_throw(*state, "otp_keywords", "transaction_state");
    }
    if ((*state)["declined_keywords"]) {
        cfg.declined_keywords = string_array_or_throw(*state, "declined_keywords", "transaction_state");
    }
    return cfg;
}

StoreConfig ConfigLoader::extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;

    const std::string mode_str = (*store)["mode"].value_or("skip"s);
    const auto mode = parse_store_mode(mode_str);
    if (!mode) {
        throw std::runtime_error(std::format("store.mode must be 'skip' or 'upsert', got '{}'", mode_str));
    }
    cfg.mode = *mode;
    cfg.max_records = static_cast<size_t>((*store)["max_records"].value_or(0));
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(false);
    cfg.poll_interval_seconds = (*cw)["poll_interval_seconds"].value_or(5);
    return cfg;
}

RuleFilePaths ConfigLoader::extract_rules(const toml::table& root) {
    RuleFilePaths cfg;
    const auto* rules = root["rules"].as_table();
    if (!rules) return cfg;
    const auto& r = *rules;

    cfg.promo_keywords = r["promo_keywords"].value_or(cfg.promo_keywords);
    cfg.bank_patterns = r["bank_patterns"].value_or(cfg.bank_patterns);
    cfg.templates = r["templates"].value_or(cfg.templates);
    cfg.accounts = r["accounts"].value_or(cfg.accounts);
    cfg.category_rules = r["category_rules"].value_or(cfg.category_rules);
    cfg.merchant_aliases = r["merchant_aliases"].value_or(cfg.merchant_aliases);
    return cfg;
}

GoldminerConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    GoldminerConfig config;
    config.logging = extract_logging(tbl);
    config.bank_identifier = extract_bank_identifier(tbl);
    config.categorizer = extract_categorizer(tbl);
    config.merchant_resolver = extract_merchant_resolver(tbl);
    config.anomaly = extract_anomaly(tbl);
    config.transaction_state = extract_transaction_state(tbl);
    config.store = extract_store(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.rules = extract_rules(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GoldminerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        auto config = extract_all_sections(tbl);

        namespace fs = std::filesystem;
        const fs::path base_dir = fs::path(config_path).parent_path();
        for (auto* path : {&config.rules.promo_keywords, &config.rules.bank_patterns,
                           &config.rules.templates, &config.rules.accounts,
                           &config.rules.category_rules, &config.rules.merchant_aliases}) {
            if (!path->empty() && fs::path(*path).is_relative()) {
                *path = (base_dir / *path).lexically_normal().string();
            }
        }
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GoldminerConfig& config) {
    std::vector<std::string> errors;

    static const std::unordered_set<std::string> kLevels = {"debug", "info", "warn", "warning", "error"};
    if (!kLevels.contains(utils::to_lower(config.logging.level))) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }
    if (config.bank_identifier.fuzzy_threshold < 0 || config.bank_identifier.fuzzy_threshold > 100) {
        errors.push_back(std::format("bank_identifier.fuzzy_threshold must be 0-100, got {}",
                                     config.bank_identifier.fuzzy_threshold));
    }
    if (config.categorizer.fuzzy_threshold < 0.0 || config.categorizer.fuzzy_threshold > 100.0) {
        errors.push_back(std::format("categorizer.fuzzy_threshold must be 0-100, got {}",
                                     config.categorizer.fuzzy_threshold));
    }
    if (config.merchant_resolver.similarity_threshold < 0.0 ||
        config.merchant_resolver.similarity_threshold > 100.0) {
        errors.push_back(std::format("merchant_resolver.similarity_threshold must be 0-100, got {}",
                                     config.merchant_resolver.similarity_threshold));
    }
    if (config.anomaly.percentile < 0.0 || config.anomaly.percentile > 100.0) {
        errors.push_back(std::format("anomaly.percentile must be 0-100, got {}", config.anomaly.percentile));
    }
    if (config.anomaly.burst_count_threshold == 0) {
        errors.push_back("anomaly.burst_count_threshold must be at least 1");
    }
    if (config.anomaly.burst_window.count() <= 0) {
        errors.push_back("anomaly.burst_window_hours must be positive");
    }
    if (config.anomaly.unknown_merchant_window == 0) {
        errors.push_back("anomaly.unknown_merchant_window must be at least 1");
    }
    if (config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back(std::format("config_watcher.poll_interval_seconds must be positive, got {}",
                                     config.config_watcher.poll_interval_seconds));
    }
    return errors;
}

// ============================================================================
// Rule files
// ============================================================================

Result<PromoKeywordSet> ConfigLoader::promo_keywords_from(const toml::table& root) {
    if (!root["english"] && !root["arabic"]) {
        return malformed<PromoKeywordSet>("expected 'english' and/or 'arabic' keyword arrays");
    }
    auto english = string_array(root, "english");
    auto arabic = string_array(root, "arabic");
    if (!english || !arabic) {
        return malformed<PromoKeywordSet>("'english' and 'arabic' must be arrays of strings");
    }
    return Result<PromoKeywordSet>::ok(PromoKeywordSet{std::move(*english), std::move(*arabic)});
}

Result<BankPatternTable> ConfigLoader::bank_patterns_from(const toml::table& root) {
    const auto* banks = root["banks"].as_array();
    if (!banks) return malformed<BankPatternTable>("No [[banks]] array found");

    BankPatternTable table;
    std::set<std::string> seen;
    for (const auto& elem : *banks) {
        const auto* node = elem.as_table();
        if (!node) return malformed<BankPatternTable>("[[banks]] entries must be tables");
        const auto& tbl = *node;

        BankPatternConfig bank;
        bank.bank_id = tbl["id"].value_or(""s);
        if (bank.bank_id.empty()) return malformed<BankPatternTable>("Bank must have an id");
        if (!seen.insert(bank.bank_id).second) {
            return malformed<BankPatternTable>(std::format("Duplicate bank id '{}'", bank.bank_id));
        }

        auto patterns = string_array(tbl, "patterns");
        if (!patterns || patterns->empty()) {
            return malformed<BankPatternTable>(
                std::format("Bank '{}': patterns must be a non-empty array of strings", bank.bank_id));
        }
        bank.patterns = std::move(*patterns);
        table.push_back(std::move(bank));
    }
    return Result<BankPatternTable>::ok(std::move(table));
}

Result<TemplateSet> ConfigLoader::templates_from(const toml::table& root) {
    const auto* banks = root["banks"].as_array();
    if (!banks) return malformed<TemplateSet>("No [[banks]] array found");

    TemplateSet set;
    for (const auto& bank_elem : *banks) {
        const auto* bank_node = bank_elem.as_table();
        if (!bank_node) return malformed<TemplateSet>("[[banks]] entries must be tables");

        BankTemplates bank;
        bank.bank_id = (*bank_node)["id"].value_or(""s);
        if (bank.bank_id.empty()) return malformed<TemplateSet>("Bank must have an id");

        const auto* templates = (*bank_node)["templates"].as_array();
        if (!templates || templates->empty()) {
            return malformed<TemplateSet>(std::format("Bank '{}': no [[banks.templates]]", bank.bank_id));
        }

        for (const auto& tmpl_elem : *templates) {
            const auto* tmpl_node = tmpl_elem.as_table();
            if (!tmpl_node) return malformed<TemplateSet>("[[banks.templates]] entries must be tables");
            const auto& t = *tmpl_node;

            ExtractionTemplate tmpl;
            tmpl.bank_id = bank.bank_id;
            tmpl.name = t["name"].value_or(""s);
            const std::string where = std::format("Template {}/{}", bank.bank_id, tmpl.name);
            if (tmpl.name.empty()) {
                return malformed<TemplateSet>(std::format("Bank '{}': template must have a name", bank.bank_id));
            }

            const auto* patterns = t["patterns"].as_table();
            if (!patterns || patterns->empty()) {
                return malformed<TemplateSet>(std::format("{}: patterns table is required", where));
            }
            for (const auto& [key, value] : *patterns) {
                const std::string field_str(key.str());
                const auto field = parse_field_name(field_str);
                if (!field) {
                    return malformed<TemplateSet>(std::format("{}: unknown field '{}'", where, field_str));
                }
                const auto* source = value.as_string();
                if (!source) {
                    return malformed<TemplateSet>(std::format("{}: pattern for '{}' must be a string",
                                                              where, field_str));
                }
                auto compiled = Pattern::compile(std::string(source->get()));
                if (compiled.is_error()) {
                    return malformed<TemplateSet>(std::format("{}: field '{}': {}", where, field_str,
                                                              compiled.error_message()));
                }
                if (!compiled.value().has_group(field_str)) {
                    return malformed<TemplateSet>(std::format(
                        "{}: pattern for '{}' must define the named group (?<{}>...)", where, field_str, field_str));
                }
                tmpl.field_patterns.emplace_back(*field, std::move(compiled.value()));
            }

            auto required = string_array(t, "required_fields");
            if (!required || required->empty()) {
                return malformed<TemplateSet>(std::format("{}: required_fields must be a non-empty array", where));
            }
            for (const auto& name : *required) {
                const auto field = parse_field_name(name);
                if (!field) {
                    return malformed<TemplateSet>(std::format("{}: unknown required field '{}'", where, name));
                }
                const bool has_pattern = std::any_of(
                    tmpl.field_patterns.begin(), tmpl.field_patterns.end(),
                    [&](const auto& fp) { return fp.first == *field; });
                if (!has_pattern) {
                    return malformed<TemplateSet>(std::format("{}: required field '{}' has no pattern", where, name));
                }
                tmpl.required_fields.insert(*field);
            }

            bank.templates.push_back(std::move(tmpl));
        }
        set.push_back(std::move(bank));
    }
    return Result<TemplateSet>::ok(std::move(set));
}

Result<AccountTable> ConfigLoader::accounts_from(const toml::table& root) {
    const auto* accounts = root["accounts"].as_array();
    if (!accounts) return malformed<AccountTable>("No [[accounts]] array found");

    AccountTable table;
    std::set<std::string> seen;
    for (size_t i = 0; i < accounts->size(); ++i) {
        const auto* node = (*accounts)[i].as_table();
        if (!node) return malformed<AccountTable>("[[accounts]] entries must be tables");
        const auto& tbl = *node;
        const std::string where = std::format("accounts[{}]", i);

        const auto* suffix = tbl["card_suffix"].as_string();
        if (!suffix) return malformed<AccountTable>(std::format("{}: card_suffix (string) is required", where));
        const std::string suffix_str(suffix->get());
        if (suffix_str.size() != 4 || !utils::is_ascii_digits(suffix_str)) {
            return malformed<AccountTable>(
                std::format("{}: card_suffix must be 4 digits, got '{}'", where, suffix_str));
        }
        if (!seen.insert(suffix_str).second) {
            return malformed<AccountTable>(std::format("{}: duplicate card_suffix '{}'", where, suffix_str));
        }

        AccountMetadata account;
        account.card_suffix = suffix_str;
        account.account_id = tbl["account_id"].value_or(""s);
        if (account.account_id.empty()) {
            return malformed<AccountTable>(std::format("{}: account_id is required", where));
        }

        const auto* type = tbl["account_type"].as_string();
        if (!type) return malformed<AccountTable>(std::format("{}: account_type is required", where));
        const auto parsed_type = parse_account_type(type->get());
        if (!parsed_type) {
            return malformed<AccountTable>(
                std::format("{}: invalid account_type '{}'", where, std::string(type->get())));
        }
        account.account_type = *parsed_type;
        account.label = tbl["label"].value_or(account.account_id);

        for (const auto& [key, target] : {std::pair{"interest_rate", &account.interest_rate},
                                          std::pair{"credit_limit", &account.credit_limit}}) {
            if (!tbl[key]) continue;
            const auto value = tbl[key].value<double>();
            if (!value) return malformed<AccountTable>(std::format("{}: {} must be a number", where, key));
            *target = *value;
        }

        if (tbl["billing_cycle"]) {
            const auto cycle = tbl["billing_cycle"].value<int64_t>();
            if (!cycle || *cycle < 1 || *cycle > 31) {
                return malformed<AccountTable>(std::format("{}: billing_cycle must be 1-31", where));
            }
            account.billing_cycle = static_cast<int>(*cycle);
        }

        account.is_known = true;
        table.push_back(std::move(account));
    }
    return Result<AccountTable>::ok(std::move(table));
}

Result<CategoryRuleSet> ConfigLoader::category_rules_from(const toml::table& root) {
    CategoryRuleSet rule_set;

    if (const auto* fallback = root["fallback"].as_table()) {
        rule_set.fallback.category = (*fallback)["category"].value_or(rule_set.fallback.category);
        rule_set.fallback.subcategory = (*fallback)["subcategory"].value_or(rule_set.fallback.subcategory);
        auto tags = string_array(*fallback, "tags");
        if (!tags) return malformed<CategoryRuleSet>("fallback.tags must be an array of strings");
        rule_set.fallback.tags.insert(tags->begin(), tags->end());
    }

    const auto* categories = root["categories"].as_array();
    if (!categories) return malformed<CategoryRuleSet>("No [[categories]] array found");

    for (const auto& elem : *categories) {
        const auto* node = elem.as_table();
        if (!node) return malformed<CategoryRuleSet>("[[categories]] entries must be tables");
        const auto& tbl = *node;

        CategoryRule rule;
        rule.category = tbl["category"].value_or(""s);
        if (rule.category.empty()) return malformed<CategoryRuleSet>("Category rule must have a category");
        rule.subcategory = tbl["subcategory"].value_or("General"s);

        auto tags = string_array(tbl, "tags");
        auto exact = string_array(tbl, "merchant_exact");
        auto fuzzy = string_array(tbl, "merchant_fuzzy");
        auto english = string_array(tbl, "keywords_english");
        auto arabic = string_array(tbl, "keywords_arabic");
        if (!tags || !exact || !fuzzy || !english || !arabic) {
            return malformed<CategoryRuleSet>(
                std::format("Category '{}': list fields must be arrays of strings", rule.category));
        }
        rule.tags.insert(tags->begin(), tags->end());
        rule.merchant_exact = std::move(*exact);
        rule.merchant_fuzzy = std::move(*fuzzy);
        rule.keywords_english = std::move(*english);
        rule.keywords_arabic = std::move(*arabic);
        rule_set.rules.push_back(std::move(rule));
    }
    return Result<CategoryRuleSet>::ok(std::move(rule_set));
}

Result<MerchantAliasTable> ConfigLoader::merchant_aliases_from(const toml::table& root) {
    const auto* merchants = root["merchants"].as_array();
    if (!merchants) return malformed<MerchantAliasTable>("No [[merchants]] array found");

    MerchantAliasTable table;
    for (const auto& elem : *merchants) {
        const auto* node = elem.as_table();
        if (!node) return malformed<MerchantAliasTable>("[[merchants]] entries must be tables");

        MerchantAlias merchant;
        merchant.canonical = (*node)["canonical"].value_or(""s);
        if (merchant.canonical.empty()) return malformed<MerchantAliasTable>("Merchant must have a canonical name");
        auto aliases = string_array(*node, "aliases");
        if (!aliases) {
            return malformed<MerchantAliasTable>(
                std::format("Merchant '{}': aliases must be an array of strings", merchant.canonical));
        }
        merchant.aliases = std::move(*aliases);
        table.push_back(std::move(merchant));
    }
    return Result<MerchantAliasTable>::ok(std::move(table));
}

// ---- load_* / parse_* ------------------------------------------------------

Result<PromoKeywordSet> ConfigLoader::load_promo_keywords(const std::string& path) {
    return load_rule_file<PromoKeywordSet>(path, promo_keywords_from);
}
Result<BankPatternTable> ConfigLoader::load_bank_patterns(const std::string& path) {
    return load_rule_file<BankPatternTable>(path, bank_patterns_from);
}
Result<TemplateSet> ConfigLoader::load_templates(const std::string& path) {
    return load_rule_file<TemplateSet>(path, templates_from);
}
Result<AccountTable> ConfigLoader::load_accounts(const std::string& path) {
    return load_rule_file<AccountTable>(path, accounts_from);
}
Result<CategoryRuleSet> ConfigLoader::load_category_rules(const std::string& path) {
    return load_rule_file<CategoryRuleSet>(path, category_rules_from);
}
Result<MerchantAliasTable> ConfigLoader::load_merchant_aliases(const std::string& path) {
    return load_rule_file<MerchantAliasTable>(path, merchant_aliases_from);
}

Result<PromoKeywordSet> ConfigLoader::parse_promo_keywords(const std::string& content) {
    return parse_rule_string<PromoKeywordSet>(content, promo_keywords_from);
}
Result<BankPatternTable> ConfigLoader::parse_bank_patterns(const std::string& content) {
    return parse_rule_string<BankPatternTable>(content, bank_patterns_from);
}
Result<TemplateSet> ConfigLoader::parse_templates(const std::string& content) {
    return parse_rule_string<TemplateSet>(content, templates_from);
}
Result<AccountTable> ConfigLoader::parse_accounts(const std::string& content) {
    return parse_rule_string<AccountTable>(content, accounts_from);
}
Result<CategoryRuleSet> ConfigLoader::parse_category_rules(const std::string& content) {
    return parse_rule_string<CategoryRuleSet>(content, category_rules_from);
}
Result<MerchantAliasTable> ConfigLoader::parse_merchant_aliases(const std::string& content) {
    return parse_rule_string<MerchantAliasTable>(content, merchant_aliases_from);
}

} // namespace goldminer
