#pragma once

#include "account/account_resolver.hpp"
#include "categorizer/categorizer.hpp"
#include "categorizer/merchant_resolver.hpp"
#include "classifier/bank_identifier.hpp"
#include "classifier/promo_classifier.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "extractor/extraction_template.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace goldminer {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GoldminerConfig config;

        [[nodiscard]] bool ok() const { return success; }
        [[nodiscard]] const std::string& error() const { return error_message; }

        static LoadResult ok(GoldminerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load main config from TOML file
     *
     * Rule file paths in the result are absolute or relative to the
     * current directory (resolved against the file's directory).
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load main config from TOML string (rule paths kept as written)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // ---- Rule files ---------------------------------------------------------
    // load_*: CONFIG_NOT_FOUND when the file is missing, CONFIG_MALFORMED on
    // a TOML or validation error. parse_*: same checks on in-memory content.

    [[nodiscard]] static Result<PromoKeywordSet> load_promo_keywords(const std::string& path);
    [[nodiscard]] static Result<BankPatternTable> load_bank_patterns(const std::string& path);
    [[nodiscard]] static Result<TemplateSet> load_templates(const std::string& path);
    [[nodiscard]] static Result<AccountTable> load_accounts(const std::string& path);
    [[nodiscard]] static Result<CategoryRuleSet> load_category_rules(const std::string& path);
    [[nodiscard]] static Result<MerchantAliasTable> load_merchant_aliases(const std::string& path);

    [[nodiscard]] static Result<PromoKeywordSet> parse_promo_keywords(const std::string& content);
    [[nodiscard]] static Result<BankPatternTable> parse_bank_patterns(const std::string& content);
    [[nodiscard]] static Result<TemplateSet> parse_templates(const std::string& content);
    [[nodiscard]] static Result<AccountTable> parse_accounts(const std::string& content);
    [[nodiscard]] static Result<CategoryRuleSet> parse_category_rules(const std::string& content);
    [[nodiscard]] static Result<MerchantAliasTable> parse_merchant_aliases(const std::string& content);

    /**
     * @brief Config validation
     * @return List of validation errors (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GoldminerConfig& config);

private:
    static GoldminerConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static BankIdentifier::Config extract_bank_identifier(const toml::table& root);
    static Categorizer::Config extract_categorizer(const toml::table& root);
    static MerchantResolver::Config extract_merchant_resolver(const toml::table& root);
    static AnomalyDetector::Config extract_anomaly(const toml::table& root);
    static TransactionStateClassifier::Config extract_transaction_state(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static RuleFilePaths extract_rules(const toml::table& root);

    static LoadResult validate_and_return(GoldminerConfig config);

    static Result<PromoKeywordSet> promo_keywords_from(const toml::table& root);
    static Result<BankPatternTable> bank_patterns_from(const toml::table& root);
    static Result<TemplateSet> templates_from(const toml::table& root);
    static Result<AccountTable> accounts_from(const toml::table& root);
    static Result<CategoryRuleSet> category_rules_from(const toml::table& root);
    static Result<MerchantAliasTable> merchant_aliases_from(const toml::table& root);

    // Helper: parse "skip"/"upsert"
    static std::optional<WriteMode> parse_store_mode(const std::string& mode_str);
};

} // namespace goldminer
