#include "core/engine.hpp"
#include "account/account_resolver.hpp"
#include "anomaly/anomaly_detector.hpp"
#include "categorizer/categorizer.hpp"
#include "categorizer/merchant_resolver.hpp"
#include "classifier/bank_identifier.hpp"
#include "classifier/promo_classifier.hpp"
#include "classifier/transaction_state_classifier.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "extractor/field_extractor.hpp"
#include "store/memory_transaction_store.hpp"

#include <format>
#include <stdexcept>

namespace goldminer {

namespace {

// nullopt: file missing (warned); throws when malformed
template<typename T>
std::optional<T> startup_rules(std::string_view name, const std::string& path, Result<T> result) {
    if (result.is_ok()) {
        utils::log::info(std::format("Loaded {} from {}", name, path));
        return std::move(result.value());
    }
    if (result.error_category() == ErrorCategory::CONFIG_NOT_FOUND) {
        utils::log::warn(std::format("{}: {} (starting without it)", name, result.error_message()));
        return std::nullopt;
    }
    throw std::runtime_error(std::format("{}: {}", name, result.error_message()));
}

} // anonymous namespace

std::unique_ptr<Engine> Engine::create(const GoldminerConfig& config) {
    auto engine = std::make_unique<Engine>();
    engine->config = config;
    const auto& rules = config.rules;
    auto& c = engine->components;

    auto promo = startup_rules("promo_keywords", rules.promo_keywords,
                               ConfigLoader::load_promo_keywords(rules.promo_keywords));
    c.promo_classifier = promo ? std::make_shared<PromoClassifier>(std::move(*promo))
                               : std::make_shared<PromoClassifier>();

    c.bank_identifier = std::make_shared<BankIdentifier>(config.bank_identifier);
    if (auto banks = startup_rules("bank_patterns", rules.bank_patterns,
                                   ConfigLoader::load_bank_patterns(rules.bank_patterns))) {
        c.bank_identifier->load(*banks);
    }

    c.field_extractor = std::make_shared<FieldExtractor>();
    if (auto templates = startup_rules("templates", rules.templates,
                                       ConfigLoader::load_templates(rules.templates))) {
        c.field_extractor->load(std::move(*templates));
    }

    c.account_resolver = std::make_shared<AccountResolver>();
    if (auto accounts = startup_rules("accounts", rules.accounts,
                                      ConfigLoader::load_accounts(rules.accounts))) {
        c.account_resolver->load(*accounts);
    }

    c.categorizer = std::make_shared<Categorizer>(config.categorizer);
    if (auto categories = startup_rules("category_rules", rules.category_rules,
                                        ConfigLoader::load_category_rules(rules.category_rules))) {
        c.categorizer->load(std::move(*categories));
    }

    c.merchant_resolver = std::make_shared<MerchantResolver>(config.merchant_resolver);
    if (auto aliases = startup_rules("merchant_aliases", rules.merchant_aliases,
                                     ConfigLoader::load_merchant_aliases(rules.merchant_aliases))) {
        c.merchant_resolver->load(*aliases);
    }

    c.state_classifier = std::make_shared<TransactionStateClassifier>(config.transaction_state);
    c.anomaly_detector = std::make_shared<AnomalyDetector>(config.anomaly);

    engine->store = std::make_shared<MemoryTransactionStore>(
        MemoryTransactionStore::Config{config.store.max_records});
    c.store = engine->store;
    c.history_provider = engine->store;

    engine->pipeline = PipelineBuilder()
        .with_promo_classifier(c.promo_classifier)
        .with_bank_identifier(c.bank_identifier)
        .with_field_extractor(c.field_extractor)
        .with_account_resolver(c.account_resolver)
        .with_state_classifier(c.state_classifier)
        .with_categorizer(c.categorizer)
        .with_merchant_resolver(c.merchant_resolver)
        .with_anomaly_detector(c.anomaly_detector)
        .with_history_provider(c.history_provider)
        .with_store(c.store)
        .build();
    return engine;
}

void Engine::register_reloads(ConfigWatcher& watcher) const {
    const auto& rules = config.rules;
    const auto& c = components;

    watcher.watch_file("promo_keywords", rules.promo_keywords,
        [promo = c.promo_classifier](const std::string& path) { return promo->reload_from_file(path); });
    watcher.watch_file("bank_patterns", rules.bank_patterns,
        [banks = c.bank_identifier](const std::string& path) { return banks->reload_from_file(path); });
    watcher.watch_file("templates", rules.templates,
        [extractor = c.field_extractor](const std::string& path) { return extractor->reload_from_file(path); });
    watcher.watch_file("accounts", rules.accounts,
        [accounts = c.account_resolver](const std::string& path) { return accounts->reload_from_file(path); });
    watcher.watch_file("category_rules", rules.category_rules,
        [categorizer = c.categorizer](const std::string& path) { return categorizer->reload_from_file(path); });
    watcher.watch_file("merchant_aliases", rules.merchant_aliases,
        [merchants = c.merchant_resolver](const std::string& path) { return merchants->reload_from_file(path); });
}

} // namespace goldminer
