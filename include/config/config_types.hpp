#pragma once

#include "anomaly/anomaly_detector.hpp"
#include "categorizer/categorizer.hpp"
#include "categorizer/merchant_resolver.hpp"
#include "classifier/bank_identifier.hpp"
#include "classifier/transaction_state_classifier.hpp"
#include "store/itransaction_store.hpp"

#include <cstdint>
#include <string>

namespace goldminer {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct StoreConfig {
    WriteMode mode = WriteMode::SKIP;
    size_t max_records = 0;   // 0 = unlimited
};

struct ConfigWatcherConfig {
    bool enabled = false;
    int poll_interval_seconds = 5;
};

/**
 * @brief Rule file locations; relative paths resolve against the
 *        directory of the main configuration file
 */
struct RuleFilePaths {
    std::string promo_keywords = "promo_keywords.toml";
    std::string bank_patterns = "bank_patterns.toml";
    std::string templates = "templates.toml";
    std::string accounts = "accounts.toml";
    std::string category_rules = "category_rules.toml";
    std::string merchant_aliases = "merchant_aliases.toml";
};

// ============================================================================
// GoldminerConfig - Complete parsed main configuration
// ============================================================================

struct GoldminerConfig {
    LoggingConfig logging;
    BankIdentifier::Config bank_identifier;
    Categorizer::Config categorizer;
    MerchantResolver::Config merchant_resolver;
    AnomalyDetector::Config anomaly;
    TransactionStateClassifier::Config transaction_state;
    StoreConfig store;
    ConfigWatcherConfig config_watcher;
    RuleFilePaths rules;
};

} // namespace goldminer
