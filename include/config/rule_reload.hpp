#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace goldminer {

/**
 * @brief Shared failure policy for reloading one rule file
 *
 * Missing file: warn. Malformed file: error. Either way the caller's
 * current snapshot stays active and false is returned. Never throws.
 *
 * @param rule_name Rule set name for log lines (e.g. "promo_keywords")
 * @param path      Rule file path
 * @param load      Callable: const std::string& -> Result<T>
 * @param apply     Callable: T&& -> void, installs the new snapshot
 */
template<typename Load, typename Apply>
bool reload_rule_file(std::string_view rule_name, const std::string& path,
                      Load&& load, Apply&& apply) {
    auto result = std::forward<Load>(load)(path);
    if (result.is_error()) {
        if (result.error_category() == ErrorCategory::CONFIG_NOT_FOUND) {
            utils::log::warn(std::format("{} reload skipped (keeping previous rules): {}",
                                          rule_name, result.error_message()));
        } else {
            utils::log::error(std::format("{} reload failed (keeping previous rules): {}",
                                           rule_name, result.error_message()));
        }
        return false;
    }
    std::forward<Apply>(apply)(std::move(result.value()));
    utils::log::info(std::format("{} reloaded from {}", rule_name, path));
    return true;
}

} // namespace goldminer
