#pragma once

#include <memory>

namespace goldminer {

// Forward declarations
class PromoClassifier;
class BankIdentifier;
class FieldExtractor;
class AccountResolver;
class TransactionStateClassifier;
class MerchantResolver;
class Categorizer;
class AnomalyDetector;
class IHistoryProvider;
class ITransactionStore;
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 *
 * Adding a component only requires adding a field here.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<PromoClassifier> promo_classifier;
    std::shared_ptr<BankIdentifier> bank_identifier;
    std::shared_ptr<FieldExtractor> field_extractor;
    std::shared_ptr<AccountResolver> account_resolver;
    std::shared_ptr<TransactionStateClassifier> state_classifier;
    std::shared_ptr<Categorizer> categorizer;

    // Optional (nullptr = disabled)
    std::shared_ptr<MerchantResolver> merchant_resolver;
    std::shared_ptr<AnomalyDetector> anomaly_detector;
    std::shared_ptr<IHistoryProvider> history_provider;
    std::shared_ptr<ITransactionStore> store;
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_promo_classifier(promo)
 *       .with_bank_identifier(banks)
 *       .with_field_extractor(extractor)
 *       .with_account_resolver(accounts)
 *       .with_state_classifier(states)
 *       .with_categorizer(categorizer)
 *       .with_anomaly_detector(detector)   // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_promo_classifier(std::shared_ptr<PromoClassifier> p)            { c_.promo_classifier = std::move(p); return *this; }
    PipelineBuilder& with_bank_identifier(std::shared_ptr<BankIdentifier> p)              { c_.bank_identifier = std::move(p); return *this; }
    PipelineBuilder& with_field_extractor(std::shared_ptr<FieldExtractor> p)              { c_.field_extractor = std::move(p); return *this; }
    PipelineBuilder& with_account_resolver(std::shared_ptr<AccountResolver> p)            { c_.account_resolver = std::move(p); return *this; }
    PipelineBuilder& with_state_classifier(std::shared_ptr<TransactionStateClassifier> p) { c_.state_classifier = std::move(p); return *this; }
    PipelineBuilder& with_categorizer(std::shared_ptr<Categorizer> p)                     { c_.categorizer = std::move(p); return *this; }
    PipelineBuilder& with_merchant_resolver(std::shared_ptr<MerchantResolver> p)          { c_.merchant_resolver = std::move(p); return *this; }
    PipelineBuilder& with_anomaly_detector(std::shared_ptr<AnomalyDetector> p)            { c_.anomaly_detector = std::move(p); return *this; }
    PipelineBuilder& with_history_provider(std::shared_ptr<IHistoryProvider> p)           { c_.history_provider = std::move(p); return *this; }
    PipelineBuilder& with_store(std::shared_ptr<ITransactionStore> p)                     { c_.store = std::move(p); return *this; }

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace goldminer
