#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

/**
 * @brief String similarity scores in [0, 100]
 *
 * All scorers first apply default processing: Unicode lowercase,
 * every non-alphanumeric code point replaced by a space, ends trimmed.
 * Comparison runs on code points, so Arabic text scores the same way
 * as Latin text.
 *
 * - ratio:            normalized indel similarity (2 * LCS / (|a| + |b|))
 * - partial_ratio:    best ratio of the shorter string against any
 *                     same-length window of the longer one
 * - token_sort_ratio: ratio after sorting whitespace tokens
 * - token_set_ratio:  ratio over shared / leftover token sets; 100 when
 *                     one token set contains the other
 */
class FuzzyMatcher {
public:
    [[nodiscard]] static double ratio(std::string_view a, std::string_view b);
    [[nodiscard]] static double partial_ratio(std::string_view a, std::string_view b);
    [[nodiscard]] static double token_sort_ratio(std::string_view a, std::string_view b);
    [[nodiscard]] static double token_set_ratio(std::string_view a, std::string_view b);

    /**
     * @brief Unicode lowercase of a UTF-8 string (ICU full case mapping)
     */
    [[nodiscard]] static std::string fold_case(std::string_view utf8);

    // Processed code points (exposed for tests)
    [[nodiscard]] static std::u32string process(std::string_view utf8);

private:
    [[nodiscard]] static double ratio_processed(const std::u32string& a, const std::u32string& b);
    [[nodiscard]] static std::vector<std::u32string> tokenize(const std::u32string& s);
    [[nodiscard]] static std::u32string join(const std::vector<std::u32string>& tokens);
};

} // namespace goldminer
