#pragma once

#include "core/pipeline_stage.hpp"
#include "core/pipeline_builder.hpp"

namespace goldminer {

/**
 * @brief Base class providing access to pipeline components
 */
class ComponentStage : public IPipelineStage {
public:
    explicit ComponentStage(PipelineComponents& c) : c_(c) {}
protected:
    PipelineComponents& c_;
};

// ============================================================================
// Enrichment Stages (run in order until one SHORT_CIRCUITs)
// ============================================================================

class NormalizeStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "normalize"; }
};

class PromoFilterStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "promo_filter"; }
};

class BankIdentifyStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "bank_identify"; }
};

class ExtractStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "extract"; }
};

class AccountResolveStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "account_resolve"; }
};

class TransactionStateStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "transaction_state"; }
};

class DateResolveStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "date_resolve"; }
};

class MerchantResolveStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "merchant_resolve"; }
};

class CategorizeStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "categorize"; }
};

class AnomalyStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "anomaly"; }
};

// ============================================================================
// Finalizers (always run, also after SHORT_CIRCUIT)
// ============================================================================

class ReviewFlagStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "review_flag"; }
};

class IdentityHashStage final : public IPipelineStage {
public:
    [[nodiscard]] Result process(MessageContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "identity_hash"; }
};

} // namespace goldminer
