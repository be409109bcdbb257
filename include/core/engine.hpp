#pragma once

#include "config/config_types.hpp"
#include "core/pipeline_builder.hpp"

#include <memory>

namespace goldminer {

class ConfigWatcher;
class MemoryTransactionStore;

/**
 * @brief Components and pipeline built from one GoldminerConfig
 *
 * Startup policy for rule files: a missing file logs a warning and the
 * component starts with its built-in (promo) or empty rules; a malformed
 * file is fatal.
 */
struct Engine {
    GoldminerConfig config;
    PipelineComponents components;
    std::shared_ptr<MemoryTransactionStore> store;
    std::shared_ptr<Pipeline> pipeline;

    /**
     * @throws std::runtime_error when a rule file is malformed
     */
    [[nodiscard]] static std::unique_ptr<Engine> create(const GoldminerConfig& config);

    /**
     * @brief Register every rule file with the watcher, each routed to its
     *        owning component's reload
     */
    void register_reloads(ConfigWatcher& watcher) const;
};

} // namespace goldminer
