#pragma once

#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace goldminer {

// One entry per card suffix; card_suffix is always set
using AccountTable = std::vector<AccountMetadata>;

// Account id used when a message carries no card suffix at all
inline constexpr std::string_view kNoCardAccountId = "unknown";

/**
 * @brief Card/Account Resolver
 *
 * extract_card_suffix() scans text with a fixed ordered list of English
 * and Arabic patterns; a trailing (?!\d) keeps a 5+ digit run from
 * yielding a 4-digit suffix.
 *
 * lookup_account() never fails for an unknown suffix: it synthesizes
 * {account_id = "unknown_<suffix>", type Unknown, is_known = false}.
 * A suffix that is not four ASCII digits is a caller bug and throws
 * InvariantViolation.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Table
 * validation happens in the loader, never at lookup time.
 */
class AccountResolver {
public:
    AccountResolver();
    explicit AccountResolver(const AccountTable& table);

    [[nodiscard]] static std::optional<std::string> extract_card_suffix(std::string_view text);

    [[nodiscard]] AccountMetadata lookup_account(const std::string& suffix) const;

    /**
     * @brief Account for a record: lookup when a suffix exists, else the
     *        no-card fallback
     */
    [[nodiscard]] AccountMetadata resolve(const std::optional<std::string>& suffix) const;

    [[nodiscard]] static AccountMetadata unknown_account(const std::string& suffix);
    [[nodiscard]] static AccountMetadata no_card_account();

    void load(const AccountTable& table);
    bool reload_from_file(const std::string& path);

    [[nodiscard]] size_t account_count() const;

private:
    struct Store {
        std::unordered_map<std::string, AccountMetadata> by_suffix;
    };

    [[nodiscard]] static std::shared_ptr<const Store> build_store(const AccountTable& table);

    std::atomic<std::shared_ptr<const Store>> store_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
