#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace goldminer {

/**
 * @brief One prior transaction as seen by the anomaly rules
 *
 * date is kept as text: history may come from sources whose timestamps
 * do not parse, and those items are skipped by time-based rules only.
 */
struct HistoryEntry {
    std::optional<double> amount;
    std::string payee;
    std::string date;
    std::string content_hash;  // empty when the source has no identity
};

using History = std::vector<HistoryEntry>;

/**
 * @brief Source of prior transactions, oldest first
 */
class IHistoryProvider {
public:
    virtual ~IHistoryProvider() = default;

    /**
     * @brief Entries whose event time is strictly before point
     */
    [[nodiscard]] virtual History history_before(Timestamp point) const = 0;
};

} // namespace goldminer
