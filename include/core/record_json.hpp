#pragma once

#include "core/pipeline.hpp"
#include "core/types.hpp"
#include "store/itransaction_store.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace goldminer {

[[nodiscard]] nlohmann::json record_to_json(const TransactionRecord& record);

/**
 * @brief Record plus its store outcome ("filtered" when not stored)
 */
[[nodiscard]] nlohmann::json record_to_json(const TransactionRecord& record,
                                            const std::optional<WriteOutcome>& outcome);

[[nodiscard]] nlohmann::json summary_to_json(const BatchSummary& summary);

} // namespace goldminer
