#include "text/keyword_matcher.hpp"
#include "text/fuzzy_matcher.hpp"
#include "text/text_normalizer.hpp"
#include "core/utils.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace goldminer {

namespace {

bool is_word_char(UChar32 c) {
    return c == '_' || u_isalnum(c);
}

} // anonymous namespace

KeywordMatcher::KeywordMatcher(const std::vector<std::string>& english,
                               const std::vector<std::string>& arabic) {
    std::unordered_set<std::string> seen;
    for (const auto& kw : english) {
        auto folded = fold(kw);
        if (folded.empty() || !seen.insert(folded).second) continue;
        english_.push_back({kw, std::move(folded)});
    }

    seen.clear();
    for (const auto& kw : arabic) {
        auto normalized = utils::collapse_whitespace(TextNormalizer::normalize_text(kw));
        if (normalized.empty() || !seen.insert(normalized).second) continue;
        arabic_.push_back(std::move(normalized));
    }
}

std::string KeywordMatcher::fold(std::string_view text) {
    return utils::collapse_whitespace(FuzzyMatcher::fold_case(text));
}

bool KeywordMatcher::contains_word(std::string_view folded_text, std::string_view word) {
    const auto* s = reinterpret_cast<const uint8_t*>(folded_text.data());
    const auto length = static_cast<int32_t>(folded_text.size());

    size_t pos = folded_text.find(word);
    while (pos != std::string_view::npos) {
        bool left_ok = true;
        if (pos > 0) {
            int32_t i = static_cast<int32_t>(pos);
            UChar32 prev = 0;
            U8_PREV(s, 0, i, prev);
            left_ok = prev < 0 || !is_word_char(prev);
        }

        bool right_ok = true;
        const size_t end = pos + word.size();
        if (end < folded_text.size()) {
            int32_t i = static_cast<int32_t>(end);
            UChar32 next = 0;
            U8_NEXT(s, i, length, next);
            right_ok = next < 0 || !is_word_char(next);
        }

        if (left_ok && right_ok) return true;
        pos = folded_text.find(word, pos + 1);
    }
    return false;
}

std::vector<std::string> KeywordMatcher::find_all(std::string_view text) const {
    std::vector<std::string> matched;
    if (text.empty()) return matched;

    if (!english_.empty()) {
        const std::string folded = fold(text);
        for (const auto& kw : english_) {
            if (contains_word(folded, kw.folded)) matched.push_back(kw.original);
        }
    }

    if (!arabic_.empty()) {
        const std::string collapsed = utils::collapse_whitespace(text);
        for (const auto& kw : arabic_) {
            if (collapsed.find(kw) != std::string::npos) matched.push_back(kw);
        }
    }
    return matched;
}

bool KeywordMatcher::any(std::string_view text) const {
    if (text.empty()) return false;
    if (!english_.empty()) {
        const std::string folded = fold(text);
        for (const auto& kw : english_) {
            if (contains_word(folded, kw.folded)) return true;
        }
    }
    if (!arabic_.empty()) {
        const std::string collapsed = utils::collapse_whitespace(text);
        return std::any_of(arabic_.begin(), arabic_.end(), [&collapsed](const std::string& kw) {
            return collapsed.find(kw) != std::string::npos;
        });
    }
    return false;
}

} // namespace goldminer
