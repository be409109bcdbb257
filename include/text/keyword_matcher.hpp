#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace goldminer {

/**
 * @brief Bilingual keyword matcher
 *
 * English keywords match case-insensitively on whole words: the
 * characters around a hit must not be letters, digits or '_'.
 * Whitespace runs inside keywords and text compare equal.
 * Arabic keywords match as plain substrings of the normalized text.
 *
 * Duplicate keywords are dropped at construction; results keep the
 * configured order (English first, then Arabic).
 */
class KeywordMatcher {
public:
    KeywordMatcher() = default;
    KeywordMatcher(const std::vector<std::string>& english,
                   const std::vector<std::string>& arabic);

    /**
     * @brief Distinct keywords present in text (English as configured,
     *        Arabic in normalized form)
     */
    [[nodiscard]] std::vector<std::string> find_all(std::string_view text) const;

    [[nodiscard]] bool any(std::string_view text) const;

    [[nodiscard]] size_t size() const { return english_.size() + arabic_.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    struct EnglishKeyword {
        std::string original;
        std::string folded;
    };

    [[nodiscard]] static std::string fold(std::string_view text);
    [[nodiscard]] static bool contains_word(std::string_view folded_text, std::string_view word);

    std::vector<EnglishKeyword> english_;
    std::vector<std::string> arabic_;
};

} // namespace goldminer
