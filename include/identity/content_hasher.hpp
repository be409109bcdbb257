#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace goldminer {

struct IdentityFields {
    std::string resolved_date;
    std::optional<std::string> amount;
    std::optional<std::string> payee;
    std::string account_id;
    TransactionState state = TransactionState::UNKNOWN;
};

/**
 * @brief Idempotency key for a transaction record
 *
 * SHA-256 (hex) over "resolved_date|amount|payee|account_id|STATE", each
 * field whitespace-collapsed. Missing amount/payee hash as empty strings;
 * an empty resolved_date or account_id throws InvariantViolation.
 */
class ContentHasher {
public:
    [[nodiscard]] static std::string compute(const IdentityFields& fields);
    [[nodiscard]] static std::string compute(const TransactionRecord& record);

    [[nodiscard]] static IdentityFields identity_of(const TransactionRecord& record);

    // Canonical pre-image (exposed for tests)
    [[nodiscard]] static std::string canonical_form(const IdentityFields& fields);

private:
    [[nodiscard]] static std::string sha256_hex(const std::string& input);
};

} // namespace goldminer
