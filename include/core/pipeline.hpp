#pragma once

#include "anomaly/history_provider.hpp"
#include "core/message_context.hpp"
#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include "core/types.hpp"
#include "store/itransaction_store.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goldminer {

struct BatchSummary {
    size_t processed = 0;
    size_t promo_filtered = 0;
    size_t unknown_bank = 0;
    size_t low_confidence = 0;
    size_t anomalous = 0;
    size_t inserted = 0;
    size_t updated = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::map<std::string, size_t> by_state;
};

struct BatchResult {
    // One per input message; nullopt when the message failed processing
    std::vector<std::optional<TransactionRecord>> records;
    // Store outcome per input message; nullopt for promo-filtered messages
    std::vector<std::optional<WriteOutcome>> outcomes;
    BatchSummary summary;
};

/**
 * @brief Pipeline coordinator - turns one SMS into one TransactionRecord
 *
 * Stages:
 * 1. Normalize text
 * 2. Promo filter (SHORT_CIRCUIT for promotional messages)
 * 3. Bank identification
 * 4. Field extraction (all banks when the bank is unknown)
 * 5. Card/account resolution
 * 6. Transaction state
 * 7. Date resolution, merchant resolution, categorization
 * 8. Anomaly detection (MONETARY only)
 * Finalizers: review flag, identity hash
 *
 * run_batch() expects messages in chronological order. Each message sees
 * the provider's entries strictly before its own event time plus the
 * MONETARY records earlier in the batch; its own stored row (same content
 * hash) is never part of that history, so re-ingesting a batch reproduces
 * the anomaly flags of the first run.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Process one message
     * @param history Prior transactions for anomaly rules (nullptr = skip)
     * @throws InvariantViolation on programming errors only
     */
    [[nodiscard]] TransactionRecord process(const RawMessage& message,
                                            const History* history = nullptr);

    /**
     * @brief Process and store a batch
     *
     * A message that throws is logged and counted as failed; the rest of
     * the batch continues. Promotional records are returned but not stored.
     * @throws std::runtime_error if the pipeline has no store
     */
    [[nodiscard]] BatchResult run_batch(const std::vector<RawMessage>& messages, WriteMode mode);

    [[nodiscard]] const PipelineComponents& components() const { return c_; }

    struct Stats {
        uint64_t messages_processed;
        uint64_t promo_filtered;
        uint64_t unknown_bank;
        uint64_t low_confidence;
        uint64_t failed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .messages_processed = messages_processed_.load(std::memory_order_relaxed),
            .promo_filtered = promo_filtered_.load(std::memory_order_relaxed),
            .unknown_bank = unknown_bank_.load(std::memory_order_relaxed),
            .low_confidence = low_confidence_.load(std::memory_order_relaxed),
            .failed = failed_.load(std::memory_order_relaxed),
        };
    }

private:
    void build_stage_chain();

    [[nodiscard]] TransactionRecord process_message(const RawMessage& message,
                                                    const History* history,
                                                    const IHistoryProvider* stored_history);

    [[nodiscard]] static HistoryEntry history_entry_of(const TransactionRecord& record);

    PipelineComponents c_;

    std::vector<std::unique_ptr<IPipelineStage>> stages_;
    std::vector<std::unique_ptr<IPipelineStage>> finalizers_;

    std::atomic<uint64_t> messages_processed_{0};
    std::atomic<uint64_t> promo_filtered_{0};
    std::atomic<uint64_t> unknown_bank_{0};
    std::atomic<uint64_t> low_confidence_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace goldminer
