#include "core/pipeline.hpp"
#include "core/pipeline_stages.hpp"
#include "account/account_resolver.hpp"
#include "core/amount.hpp"
#include "core/date_resolver.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace goldminer {

Pipeline::Pipeline(PipelineComponents components)
    : c_(std::move(components)) {
    build_stage_chain();
}

void Pipeline::build_stage_chain() {
    stages_.push_back(std::make_unique<NormalizeStage>());
    stages_.push_back(std::make_unique<PromoFilterStage>(c_));
    stages_.push_back(std::make_unique<BankIdentifyStage>(c_));
    stages_.push_back(std::make_unique<ExtractStage>(c_));
    stages_.push_back(std::make_unique<AccountResolveStage>(c_));
    stages_.push_back(std::make_unique<TransactionStateStage>(c_));
    stages_.push_back(std::make_unique<DateResolveStage>());
    stages_.push_back(std::make_unique<MerchantResolveStage>(c_));
    stages_.push_back(std::make_unique<CategorizeStage>(c_));
    stages_.push_back(std::make_unique<AnomalyStage>(c_));

    // Promotional messages skip enrichment but still get a date and a hash
    finalizers_.push_back(std::make_unique<DateResolveStage>());
    finalizers_.push_back(std::make_unique<ReviewFlagStage>());
    finalizers_.push_back(std::make_unique<IdentityHashStage>());
}

TransactionRecord Pipeline::process(const RawMessage& message, const History* history) {
    return process_message(message, history, nullptr);
}

TransactionRecord Pipeline::process_message(const RawMessage& message, const History* history,
                                            const IHistoryProvider* stored_history) {
    utils::Timer timer;

    MessageContext ctx;
    ctx.raw = message;
    ctx.history = history;
    ctx.stored_history = stored_history;
    ctx.record.bank = BankMatch::unknown();
    ctx.record.account = AccountResolver::no_card_account();

    for (const auto& stage : stages_) {
        if (stage->process(ctx) == IPipelineStage::Result::SHORT_CIRCUIT) {
            utils::log::debug(std::format("Stage {} short-circuited", stage->name()));
            break;
        }
    }
    for (const auto& finalizer : finalizers_) {
        static_cast<void>(finalizer->process(ctx));
    }
    ctx.elapsed = timer.elapsed_us();

    messages_processed_.fetch_add(1, std::memory_order_relaxed);
    if (ctx.record.promo.skip) promo_filtered_.fetch_add(1, std::memory_order_relaxed);
    if (!ctx.record.promo.skip && ctx.record.bank.unmatched) {
        unknown_bank_.fetch_add(1, std::memory_order_relaxed);
    }
    if (ctx.record.low_confidence()) {
        low_confidence_.fetch_add(1, std::memory_order_relaxed);
    }

    return std::move(ctx.record);
}

HistoryEntry Pipeline::history_entry_of(const TransactionRecord& record) {
    HistoryEntry entry;
    if (record.fields.amount) entry.amount = parse_amount(*record.fields.amount);
    entry.payee = record.normalized_merchant.value_or(record.fields.payee.value_or(""));
    if (record.event_time) entry.date = DateResolver::format_datetime(*record.event_time);
    entry.content_hash = record.content_hash;
    return entry;
}

BatchResult Pipeline::run_batch(const std::vector<RawMessage>& messages, WriteMode mode) {
    if (!c_.store) throw std::runtime_error("Pipeline: run_batch requires a store");

    utils::Timer timer;
    BatchResult result;
    result.records.resize(messages.size());
    result.outcomes.resize(messages.size());
    auto& summary = result.summary;

    // Earlier MONETARY records of this batch; committed history is read
    // per message so that re-ingestion sees the same past as the first run
    History history;

    std::vector<TransactionRecord> to_store;
    std::vector<size_t> stored_index;

    for (size_t i = 0; i < messages.size(); ++i) {
        ++summary.processed;
        try {
            auto record = process_message(messages[i], &history, c_.history_provider.get());

            ++summary.by_state[transaction_state_to_string(record.transaction_state)];
            if (record.promo.skip) {
                ++summary.promo_filtered;
            } else {
                if (record.bank.unmatched) ++summary.unknown_bank;
                stored_index.push_back(i);
                to_store.push_back(record);
            }
            if (record.low_confidence()) ++summary.low_confidence;
            if (!record.anomalies.empty()) ++summary.anomalous;
            if (record.aggregatable()) history.push_back(history_entry_of(record));

            result.records[i] = std::move(record);
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Message {} failed: {}", i, e.what()));
            result.outcomes[i] = WriteOutcome::FAILED;
            ++summary.failed;
        }
    }

    const auto written = c_.store->write_batch(to_store, mode);
    for (size_t j = 0; j < stored_index.size(); ++j) {
        result.outcomes[stored_index[j]] = written.outcomes[j];
    }
    summary.inserted = written.inserted;
    summary.updated = written.updated;
    summary.skipped = written.skipped;
    summary.failed += written.failed;

    utils::log::info(std::format(
        "Batch done in {}ms: processed={} promo_filtered={} unknown_bank={} low_confidence={} "
        "inserted={} updated={} skipped={} failed={} anomalous={}",
        timer.elapsed_ms().count(), summary.processed, summary.promo_filtered, summary.unknown_bank,
        summary.low_confidence, summary.inserted, summary.updated, summary.skipped, summary.failed,
        summary.anomalous));
    return result;
}

} // namespace goldminer
