#pragma once

#include "core/message_context.hpp"
#include <string_view>

namespace goldminer {

/**
 * @brief One step of the SMS pipeline (filter, identify, extract, enrich)
 *
 * A stage reads what earlier stages left in the MessageContext and adds
 * its own findings. Returning SHORT_CIRCUIT marks the message as settled
 * (promotional, OTP, unmatched bank): enrichment stages are skipped but
 * the identity and state finalizers still run.
 */
class IPipelineStage {
public:
    enum class Result { CONTINUE, SHORT_CIRCUIT };

    virtual ~IPipelineStage() = default;

    [[nodiscard]] virtual Result process(MessageContext& ctx) = 0;

    // Used in debug logs and per-stage timing
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace goldminer
