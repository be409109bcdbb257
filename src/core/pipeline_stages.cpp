#include "core/pipeline_stages.hpp"
#include "account/account_resolver.hpp"
#include "anomaly/anomaly_detector.hpp"
#include "categorizer/categorizer.hpp"
#include "categorizer/merchant_resolver.hpp"
#include "classifier/bank_identifier.hpp"
#include "classifier/promo_classifier.hpp"
#include "classifier/transaction_state_classifier.hpp"
#include "core/amount.hpp"
#include "core/date_resolver.hpp"
#include "core/utils.hpp"
#include "extractor/field_extractor.hpp"
#include "identity/content_hasher.hpp"
#include "text/text_normalizer.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>
#include <utility>
#include <vector>

namespace goldminer {

namespace {

// Merchant name later stages key on: canonical when resolved, else payee
std::string merchant_of(const TransactionRecord& record) {
    if (record.normalized_merchant) return *record.normalized_merchant;
    return record.fields.payee.value_or("");
}

/**
 * History the anomaly rules see for one message: committed entries strictly
 * before its event time merged with ctx.history, oldest first. Entries
 * carrying the message's own content hash are dropped, and a committed
 * entry also present in ctx.history is counted once.
 */
History prior_history(const MessageContext& ctx) {
    const std::string& own = ctx.record.content_hash;

    History given;
    std::unordered_set<std::string> given_hashes;
    if (ctx.history) {
        given.reserve(ctx.history->size());
        for (const auto& entry : *ctx.history) {
            if (!entry.content_hash.empty()) {
                if (entry.content_hash == own) continue;
                given_hashes.insert(entry.content_hash);
            }
            given.push_back(entry);
        }
    }
    if (!ctx.stored_history) return given;

    const Timestamp point = ctx.record.event_time.value_or(Timestamp::max());
    std::vector<std::pair<Timestamp, HistoryEntry>> dated;
    for (auto& entry : ctx.stored_history->history_before(point)) {
        if (entry.content_hash == own || given_hashes.contains(entry.content_hash)) continue;
        const auto when = DateResolver::parse_timestamp(entry.date).value_or(Timestamp::min());
        dated.emplace_back(when, std::move(entry));
    }
    for (auto& entry : given) {
        const auto when = DateResolver::parse_timestamp(entry.date).value_or(Timestamp::min());
        dated.emplace_back(when, std::move(entry));
    }
    std::stable_sort(dated.begin(), dated.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    History prior;
    prior.reserve(dated.size());
    for (auto& [when, entry] : dated) prior.push_back(std::move(entry));
    return prior;
}

} // anonymous namespace

// ============================================================================
// NormalizeStage
// ============================================================================
IPipelineStage::Result NormalizeStage::process(MessageContext& ctx) {
    auto normalized = TextNormalizer::normalize(ctx.raw.text);
    ctx.record.message_text = std::move(normalized.text);
    ctx.record.text_repaired = normalized.repaired;
    return Result::CONTINUE;
}

// ============================================================================
// PromoFilterStage
// ============================================================================
IPipelineStage::Result PromoFilterStage::process(MessageContext& ctx) {
    ctx.record.promo = c_.promo_classifier->classify(ctx.record.message_text);
    if (!ctx.record.promo.skip) return Result::CONTINUE;

    ctx.record.transaction_state = TransactionState::PROMO;
    ctx.record.fields.confidence = Confidence::LOW;
    utils::log::debug(std::format("Promotional message skipped: {}", ctx.record.promo.reason));
    return Result::SHORT_CIRCUIT;
}

// ============================================================================
// BankIdentifyStage
// ============================================================================
IPipelineStage::Result BankIdentifyStage::process(MessageContext& ctx) {
    ctx.record.bank = c_.bank_identifier->identify(ctx.record.message_text);
    if (ctx.record.bank.unmatched) {
        ctx.selector = AutoDetect{};
        utils::log::warn("No bank pattern matched, extracting with all templates");
    } else {
        ctx.selector = SpecifiedBank{ctx.record.bank.bank_id};
    }
    return Result::CONTINUE;
}

// ============================================================================
// ExtractStage
// ============================================================================
IPipelineStage::Result ExtractStage::process(MessageContext& ctx) {
    ctx.record.fields = c_.field_extractor->extract(ctx.record.message_text, ctx.selector);
    if (ctx.record.fields.amount) {
        ctx.amount_value = parse_amount(*ctx.record.fields.amount);
    }
    return Result::CONTINUE;
}

// ============================================================================
// AccountResolveStage
// ============================================================================
IPipelineStage::Result AccountResolveStage::process(MessageContext& ctx) {
    auto& fields = ctx.record.fields;
    if (!fields.card_suffix) {
        fields.card_suffix = AccountResolver::extract_card_suffix(ctx.record.message_text);
    }
    ctx.record.account = c_.account_resolver->resolve(fields.card_suffix);
    return Result::CONTINUE;
}

// ============================================================================
// TransactionStateStage
// ============================================================================
IPipelineStage::Result TransactionStateStage::process(MessageContext& ctx) {
    ctx.record.transaction_state = c_.state_classifier->classify(StateInput{
        ctx.record.message_text, ctx.record.promo.skip, ctx.record.fields.amount.has_value()});
    return Result::CONTINUE;
}

// ============================================================================
// DateResolveStage
// ============================================================================
IPipelineStage::Result DateResolveStage::process(MessageContext& ctx) {
    if (!ctx.record.resolved_date.empty()) return Result::CONTINUE;

    const auto resolved = DateResolver::resolve(
        ctx.record.fields.date_raw,
        DateContext{ctx.raw.source_timestamp, ctx.raw.file_created_at});
    ctx.record.resolved_date = resolved.iso;
    ctx.record.event_time = resolved.event_time;
    return Result::CONTINUE;
}

// ============================================================================
// MerchantResolveStage
// ============================================================================
IPipelineStage::Result MerchantResolveStage::process(MessageContext& ctx) {
    if (!c_.merchant_resolver || !ctx.record.fields.payee) return Result::CONTINUE;

    if (auto match = c_.merchant_resolver->resolve(*ctx.record.fields.payee)) {
        ctx.record.normalized_merchant = std::move(match->canonical);
    }
    return Result::CONTINUE;
}

// ============================================================================
// CategorizeStage
// ============================================================================
IPipelineStage::Result CategorizeStage::process(MessageContext& ctx) {
    ctx.record.category = c_.categorizer->categorize(merchant_of(ctx.record), ctx.record.message_text);
    return Result::CONTINUE;
}

// ============================================================================
// AnomalyStage (MONETARY only, informational)
// ============================================================================
IPipelineStage::Result AnomalyStage::process(MessageContext& ctx) {
    if (!c_.anomaly_detector || (!ctx.history && !ctx.stored_history)) return Result::CONTINUE;
    if (ctx.record.transaction_state != TransactionState::MONETARY) return Result::CONTINUE;

    // Identity fields are final here; the hash tells this message's own
    // stored row apart from its history
    ctx.record.content_hash = ContentHasher::compute(ctx.record);
    ctx.record.anomalies = c_.anomaly_detector->check(
        AnomalyCandidate{ctx.amount_value, merchant_of(ctx.record), ctx.record.event_time},
        prior_history(ctx));
    return Result::CONTINUE;
}

// ============================================================================
// Finalizers
// ============================================================================
IPipelineStage::Result ReviewFlagStage::process(MessageContext& ctx) {
    ctx.record.needs_review = ctx.record.low_confidence();
    return Result::CONTINUE;
}

IPipelineStage::Result IdentityHashStage::process(MessageContext& ctx) {
    ctx.record.content_hash = ContentHasher::compute(ctx.record);
    return Result::CONTINUE;
}

} // namespace goldminer
