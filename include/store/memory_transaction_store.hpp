#pragma once

#include "anomaly/history_provider.hpp"
#include "store/itransaction_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace goldminer {

/**
 * @brief In-memory record store and history source
 *
 * Each batch is applied to a private copy of the tables and swapped in
 * only when every record succeeded. Also serves committed MONETARY
 * records as anomaly history.
 */
class MemoryTransactionStore final : public ITransactionStore, public IHistoryProvider {
public:
    struct Config {
        size_t max_records = 0;   // 0 = unlimited
    };

    MemoryTransactionStore() : MemoryTransactionStore(Config{}) {}
    explicit MemoryTransactionStore(const Config& config);

    [[nodiscard]] BatchWriteResult write_batch(const std::vector<TransactionRecord>& records,
                                               WriteMode mode) override;

    [[nodiscard]] std::optional<TransactionRecord> find_by_hash(const std::string& hash) const override;

    [[nodiscard]] size_t size() const override;

    [[nodiscard]] History history_before(Timestamp point) const override;

    [[nodiscard]] std::vector<TransactionRecord> records() const;

private:
    using Key = std::tuple<std::string, std::string, std::string, std::string>;

    struct Tables {
        std::vector<TransactionRecord> rows;
        std::map<Key, size_t> by_key;
        std::unordered_map<std::string, size_t> by_hash;
    };

    [[nodiscard]] static Key key_of(const TransactionRecord& record);

    // Applies one record to tables; throws std::runtime_error on failure
    WriteOutcome apply(Tables& tables, const TransactionRecord& record, WriteMode mode) const;

    Config config_;
    mutable std::shared_mutex mutex_;
    Tables tables_;
};

} // namespace goldminer
