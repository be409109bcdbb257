#include "text/fuzzy_matcher.hpp"

#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <iterator>

namespace goldminer {

namespace {

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    if (a.empty() || b.empty()) return 0;
    std::vector<size_t> prev(b.size() + 1, 0);
    std::vector<size_t> curr(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            curr[j] = (a[i - 1] == b[j - 1])
                ? prev[j - 1] + 1
                : std::max(prev[j], curr[j - 1]);
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

std::u32string trim(const std::u32string& s) {
    const auto first = s.find_first_not_of(U' ');
    if (first == std::u32string::npos) return {};
    const auto last = s.find_last_not_of(U' ');
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ============================================================================
// Processing
// ============================================================================

std::string FuzzyMatcher::fold_case(std::string_view utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    u.toLower();
    std::string out;
    u.toUTF8String(out);
    return out;
}

std::u32string FuzzyMatcher::process(std::string_view utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    u.toLower();

    std::u32string out;
    out.reserve(static_cast<size_t>(u.length()));
    for (int32_t i = 0; i < u.length(); ) {
        const UChar32 c = u.char32At(i);
        i += U16_LENGTH(c);
        out += u_isalnum(c) ? static_cast<char32_t>(c) : U' ';
    }
    return trim(out);
}

std::vector<std::u32string> FuzzyMatcher::tokenize(const std::u32string& s) {
    std::vector<std::u32string> tokens;
    std::u32string current;
    for (const char32_t c : s) {
        if (c == U' ') {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

std::u32string FuzzyMatcher::join(const std::vector<std::u32string>& tokens) {
    std::u32string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += U' ';
        out += t;
    }
    return out;
}

// ============================================================================
// Scorers
// ============================================================================

double FuzzyMatcher::ratio_processed(const std::u32string& a, const std::u32string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 200.0 * static_cast<double>(lcs_length(a, b)) / static_cast<double>(total);
}

double FuzzyMatcher::ratio(std::string_view a, std::string_view b) {
    const auto pa = process(a);
    const auto pb = process(b);
    if (pa.empty() || pb.empty()) return 0.0;
    return ratio_processed(pa, pb);
}

double FuzzyMatcher::partial_ratio(std::string_view a, std::string_view b) {
    auto shorter = process(a);
    auto longer = process(b);
    if (shorter.empty() || longer.empty()) return 0.0;
    if (shorter.size() > longer.size()) std::swap(shorter, longer);

    const size_t m = shorter.size();
    double best = 0.0;

    // Full-length windows, then windows hanging off either end
    for (size_t start = 0; start + m <= longer.size(); ++start) {
        best = std::max(best, ratio_processed(shorter, longer.substr(start, m)));
        if (best >= 100.0) return 100.0;
    }
    for (size_t len = 1; len < m && len <= longer.size(); ++len) {
        best = std::max(best, ratio_processed(shorter, longer.substr(0, len)));
        best = std::max(best, ratio_processed(shorter, longer.substr(longer.size() - len)));
    }
    return best;
}

double FuzzyMatcher::token_sort_ratio(std::string_view a, std::string_view b) {
    auto ta = tokenize(process(a));
    auto tb = tokenize(process(b));
    if (ta.empty() || tb.empty()) return 0.0;
    std::sort(ta.begin(), ta.end());
    std::sort(tb.begin(), tb.end());
    return ratio_processed(join(ta), join(tb));
}

double FuzzyMatcher::token_set_ratio(std::string_view a, std::string_view b) {
    auto ta = tokenize(process(a));
    auto tb = tokenize(process(b));
    if (ta.empty() || tb.empty()) return 0.0;

    std::sort(ta.begin(), ta.end());
    ta.erase(std::unique(ta.begin(), ta.end()), ta.end());
    std::sort(tb.begin(), tb.end());
    tb.erase(std::unique(tb.begin(), tb.end()), tb.end());

    std::vector<std::u32string> common, only_a, only_b;
    std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(common));
    std::set_difference(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(only_a));
    std::set_difference(tb.begin(), tb.end(), ta.begin(), ta.end(), std::back_inserter(only_b));

    if (!common.empty() && (only_a.empty() || only_b.empty())) return 100.0;

    const auto sect = join(common);
    auto with_sep = [&sect](const std::vector<std::u32string>& rest) {
        if (sect.empty()) return join(rest);
        return sect + U' ' + join(rest);
    };
    const auto combined_a = with_sep(only_a);
    const auto combined_b = with_sep(only_b);

    double best = ratio_processed(combined_a, combined_b);
    if (!sect.empty()) {
        best = std::max(best, ratio_processed(sect, combined_a));
        best = std::max(best, ratio_processed(sect, combined_b));
    }
    return best;
}

} // namespace goldminer
