#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace goldminer {

struct MerchantAlias {
    std::string canonical;
    std::vector<std::string> aliases;
};

using MerchantAliasTable = std::vector<MerchantAlias>;

struct MerchantMatch {
    std::string canonical;
    double score = 0.0;   // 100 for an exact alias hit
    bool fuzzy = false;
};

/**
 * @brief Maps raw payee text to a canonical merchant name
 *
 * Exact case-insensitive alias lookup first, then the alias with the best
 * fuzzy ratio at or above the similarity threshold (earlier alias wins
 * ties). Canonical names count as their own aliases.
 */
class MerchantResolver {
public:
    struct Config {
        double similarity_threshold = 85.0;
    };

    MerchantResolver() : MerchantResolver(Config{}) {}
    explicit MerchantResolver(const Config& config);
    MerchantResolver(const Config& config, const MerchantAliasTable& table);

    [[nodiscard]] std::optional<MerchantMatch> resolve(std::string_view payee) const;

    /**
     * @brief Canonical name, or the trimmed payee when nothing resolves
     */
    [[nodiscard]] std::string canonical_or_payee(std::string_view payee) const;

    [[nodiscard]] std::vector<std::string> all_merchants() const;

    void load(const MerchantAliasTable& table);
    bool reload_from_file(const std::string& path);

private:
    struct Store {
        std::unordered_map<std::string, std::string> alias_to_canonical;   // folded alias
        std::vector<std::pair<std::string, std::string>> ordered_aliases;  // (folded alias, canonical)
    };

    [[nodiscard]] static std::shared_ptr<const Store> build_store(const MerchantAliasTable& table);

    Config config_;
    std::atomic<std::shared_ptr<const Store>> store_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
