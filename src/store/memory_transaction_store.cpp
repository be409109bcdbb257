#include "store/memory_transaction_store.hpp"
#include "core/amount.hpp"
#include "core/date_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace goldminer {

MemoryTransactionStore::MemoryTransactionStore(const Config& config)
    : config_(config) {}

MemoryTransactionStore::Key MemoryTransactionStore::key_of(const TransactionRecord& record) {
    return {record.resolved_date,
            record.fields.payee.value_or(""),
            record.fields.amount.value_or(""),
            record.account.account_id};
}

WriteOutcome MemoryTransactionStore::apply(Tables& tables, const TransactionRecord& record,
                                           WriteMode mode) const {
    if (record.content_hash.empty()) {
        throw std::runtime_error("record has no content hash");
    }
    if (record.resolved_date.empty() || record.account.account_id.empty()) {
        throw std::runtime_error("record is missing resolved_date or account_id");
    }

    const Key key = key_of(record);
    auto existing = tables.by_key.find(key);
    if (existing == tables.by_key.end()) {
        if (const auto h = tables.by_hash.find(record.content_hash); h != tables.by_hash.end()) {
            existing = tables.by_key.find(key_of(tables.rows[h->second]));
        }
    }

    if (existing != tables.by_key.end()) {
        if (mode == WriteMode::SKIP) return WriteOutcome::SKIPPED;

        const size_t index = existing->second;
        auto& row = tables.rows[index];
        tables.by_hash.erase(row.content_hash);
        tables.by_key.erase(existing);
        row = record;
        tables.by_key[key] = index;
        tables.by_hash[record.content_hash] = index;
        return WriteOutcome::UPDATED;
    }

    if (config_.max_records != 0 && tables.rows.size() >= config_.max_records) {
        throw std::runtime_error(std::format("store capacity of {} records reached", config_.max_records));
    }

    const size_t index = tables.rows.size();
    tables.rows.push_back(record);
    tables.by_key[key] = index;
    tables.by_hash[record.content_hash] = index;
    return WriteOutcome::INSERTED;
}

BatchWriteResult MemoryTransactionStore::write_batch(const std::vector<TransactionRecord>& records,
                                                     WriteMode mode) {
    BatchWriteResult result;
    result.outcomes.reserve(records.size());

    std::unique_lock lock(mutex_);
    Tables working = tables_;

    try {
        for (const auto& record : records) {
            result.outcomes.push_back(apply(working, record, mode));
        }
    } catch (const std::runtime_error& e) {
        utils::log::error(std::format("Store batch rolled back ({} records): {}", records.size(), e.what()));
        result.outcomes.assign(records.size(), WriteOutcome::FAILED);
        result.failed = records.size();
        result.error = e.what();
        return result;
    }

    tables_ = std::move(working);
    result.committed = true;
    for (const auto outcome : result.outcomes) {
        switch (outcome) {
            case WriteOutcome::INSERTED: ++result.inserted; break;
            case WriteOutcome::UPDATED:  ++result.updated; break;
            case WriteOutcome::SKIPPED:  ++result.skipped; break;
            case WriteOutcome::FAILED:   ++result.failed; break;
        }
    }
    return result;
}

std::optional<TransactionRecord> MemoryTransactionStore::find_by_hash(const std::string& hash) const {
    std::shared_lock lock(mutex_);
    const auto it = tables_.by_hash.find(hash);
    if (it == tables_.by_hash.end()) return std::nullopt;
    return tables_.rows[it->second];
}

size_t MemoryTransactionStore::size() const {
    std::shared_lock lock(mutex_);
    return tables_.rows.size();
}

std::vector<TransactionRecord> MemoryTransactionStore::records() const {
    std::shared_lock lock(mutex_);
    return tables_.rows;
}

History MemoryTransactionStore::history_before(Timestamp point) const {
    std::vector<std::pair<Timestamp, HistoryEntry>> dated;
    {
        std::shared_lock lock(mutex_);
        for (const auto& row : tables_.rows) {
            if (!row.aggregatable() || !row.event_time || *row.event_time >= point) continue;
            HistoryEntry entry;
            if (row.fields.amount) entry.amount = parse_amount(*row.fields.amount);
            entry.payee = row.normalized_merchant.value_or(row.fields.payee.value_or(""));
            entry.date = DateResolver::format_datetime(*row.event_time);
            entry.content_hash = row.content_hash;
            dated.emplace_back(*row.event_time, std::move(entry));
        }
    }
    std::stable_sort(dated.begin(), dated.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    History history;
    history.reserve(dated.size());
    for (auto& [when, entry] : dated) history.push_back(std::move(entry));
    return history;
}

} // namespace goldminer
