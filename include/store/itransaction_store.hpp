#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace goldminer {

enum class WriteMode { SKIP, UPSERT };

enum class WriteOutcome { INSERTED, UPDATED, SKIPPED, FAILED };

[[nodiscard]] inline const char* write_mode_to_string(WriteMode mode) {
    return mode == WriteMode::UPSERT ? "upsert" : "skip";
}

[[nodiscard]] inline std::optional<WriteMode> parse_write_mode(const std::string& s) {
    if (s == "skip") return WriteMode::SKIP;
    if (s == "upsert") return WriteMode::UPSERT;
    return std::nullopt;
}

[[nodiscard]] inline const char* write_outcome_to_string(WriteOutcome outcome) {
    switch (outcome) {
        case WriteOutcome::INSERTED: return "inserted";
        case WriteOutcome::UPDATED:  return "updated";
        case WriteOutcome::SKIPPED:  return "skipped";
        case WriteOutcome::FAILED:   return "failed";
    }
    return "failed";
}

struct BatchWriteResult {
    std::vector<WriteOutcome> outcomes;   // one per input record, same order
    size_t inserted = 0;
    size_t updated = 0;
    size_t skipped = 0;
    size_t failed = 0;
    bool committed = false;
    std::string error;
};

/**
 * @brief Persistence contract for processed records
 *
 * Records are unique on (resolved_date, payee, amount, account_id); the
 * content hash is the idempotency key. A batch is applied all-or-nothing:
 * on any failure nothing is written and every outcome is FAILED.
 */
class ITransactionStore {
public:
    virtual ~ITransactionStore() = default;

    [[nodiscard]] virtual BatchWriteResult write_batch(const std::vector<TransactionRecord>& records,
                                                       WriteMode mode) = 0;

    [[nodiscard]] virtual std::optional<TransactionRecord> find_by_hash(const std::string& hash) const = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

} // namespace goldminer
