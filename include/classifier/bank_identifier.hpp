#pragma once

#include "core/types.hpp"
#include "text/pattern.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

struct BankPatternConfig {
    std::string bank_id;
    std::vector<std::string> patterns;   // regex fragments or literals
};

// Declaration order is evaluation order
using BankPatternTable = std::vector<BankPatternConfig>;

/**
 * @brief Bank Identifier - determines which bank sent a message
 *
 * Two stages:
 * 1. Exact: case-insensitive regex search of every pattern, banks in
 *    table order. The first bank with any matching pattern wins with
 *    score 100. A pattern that does not compile as a regex is matched
 *    as a literal substring instead.
 * 2. Fuzzy (only when stage 1 found nothing): partial_ratio between each
 *    pattern and the message. The bank with the highest score at or
 *    above the threshold wins; equal scores go to the earlier bank.
 *
 * No match: "unknown_bank" with score 0. An exact match therefore always
 * outranks a fuzzy one, whatever the fuzzy score.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr).
 */
class BankIdentifier {
public:
    struct Config {
        int fuzzy_threshold = 80;
        bool enable_fuzzy = true;
    };

    BankIdentifier() : BankIdentifier(Config{}) {}
    explicit BankIdentifier(const Config& config);
    BankIdentifier(const Config& config, const BankPatternTable& table);

    [[nodiscard]] BankMatch identify(std::string_view text) const;

    /**
     * @brief Same result per item as calling identify() in a loop
     */
    [[nodiscard]] std::vector<BankMatch> identify_batch(
        const std::vector<std::string>& messages) const;

    /**
     * @brief Message count per bank id (unknown_bank included)
     */
    [[nodiscard]] std::map<std::string, size_t> bank_statistics(
        const std::vector<std::string>& messages) const;

    void load(const BankPatternTable& table);
    bool reload_from_file(const std::string& path);

    [[nodiscard]] std::vector<std::string> bank_ids() const;
    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct CompiledPattern {
        std::string raw;
        std::optional<Pattern> regex;
        std::string literal_folded;   // used when regex is empty
    };

    struct CompiledBank {
        std::string bank_id;
        std::vector<CompiledPattern> patterns;
    };

    struct Store {
        std::vector<CompiledBank> banks;
    };

    [[nodiscard]] static std::shared_ptr<const Store> build_store(const BankPatternTable& table);
    [[nodiscard]] static bool exact_match(const CompiledPattern& p, std::string_view text,
                                          const std::string& folded_text);

    Config config_;
    std::atomic<std::shared_ptr<const Store>> store_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
