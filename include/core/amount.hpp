#pragma once

#include "core/utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace goldminer {

/**
 * @brief Parse raw amount text ("1,250.50", "١٬٢٥٠٫٥٠" after digit mapping)
 *
 * Arabic decimal (U+066B) and thousands (U+066C) separators map to '.'
 * and ','; thousands separators and spaces are dropped.
 * Returns std::nullopt when the remainder is not a plain decimal number.
 */
[[nodiscard]] inline std::optional<double> parse_amount(std::string_view raw) {
    static constexpr std::string_view kArabicDecimal = "\xD9\xAB";
    static constexpr std::string_view kArabicThousands = "\xD9\xAC";

    std::string cleaned;
    cleaned.reserve(raw.size());
    for (size_t i = 0; i < raw.size();) {
        const std::string_view rest = raw.substr(i);
        if (rest.starts_with(kArabicDecimal)) {
            cleaned += '.';
            i += kArabicDecimal.size();
            continue;
        }
        if (rest.starts_with(kArabicThousands)) {
            i += kArabicThousands.size();
            continue;
        }
        const char c = raw[i++];
        if (c == ',' || c == ' ') continue;
        cleaned += c;
    }
    if (cleaned.empty()) return std::nullopt;
    return utils::try_parse_double(cleaned);
}

} // namespace goldminer
