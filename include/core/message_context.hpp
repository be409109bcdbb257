#pragma once

#include "anomaly/history_provider.hpp"
#include "core/types.hpp"
#include "extractor/extraction_template.hpp"

#include <chrono>
#include <optional>

namespace goldminer {

/**
 * @brief Message context - carries one message through the pipeline
 *
 * Stages only add to record; a field resolved by an earlier stage is
 * never overwritten by a later one.
 */
struct MessageContext {
    // Input
    RawMessage raw;

    // Prior transactions for anomaly rules: caller-supplied, or the
    // earlier records of a batch (nullptr = none available)
    const History* history = nullptr;
    // Committed records; only entries strictly before this message count
    const IHistoryProvider* stored_history = nullptr;

    // Intermediate results
    BankSelector selector = AutoDetect{};
    std::optional<double> amount_value;

    // Output
    TransactionRecord record;

    // Timing
    std::chrono::microseconds elapsed{0};
};

} // namespace goldminer
