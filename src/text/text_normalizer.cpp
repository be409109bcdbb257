#include "text/text_normalizer.hpp"
#include "core/utils.hpp"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <format>
#include <optional>

namespace goldminer {

namespace {

// Each pass strictly shrinks mojibake, so a fixpoint is reached well before this
constexpr int kMaxPasses = 8;

constexpr UChar kArabicIndicZero = 0x0660;
constexpr UChar kArabicIndicNine = 0x0669;

// Windows-1252 bytes 0x80..0x9F; 0 = undefined in the code page
constexpr UChar32 kCp1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

std::optional<unsigned char> to_single_byte(UChar32 c) {
    if (c >= 0 && c <= 0xFF) return static_cast<unsigned char>(c);
    for (int i = 0; i < 32; ++i) {
        if (kCp1252High[i] == c) return static_cast<unsigned char>(0x80 + i);
    }
    return std::nullopt;
}

bool is_valid_utf8(const std::string& bytes) {
    const auto* s = reinterpret_cast<const uint8_t*>(bytes.data());
    const auto length = static_cast<int32_t>(bytes.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

/**
 * @brief Undo one layer of "UTF-8 bytes decoded as Latin-1/CP1252"
 * @return Repaired text, or nullopt when the text is not mojibake
 */
std::optional<icu::UnicodeString> repair_mojibake(const icu::UnicodeString& text) {
    std::string bytes;
    bytes.reserve(static_cast<size_t>(text.length()));
    bool has_high_byte = false;

    for (int32_t i = 0; i < text.length(); ) {
        const UChar32 c = text.char32At(i);
        i += U16_LENGTH(c);
        const auto byte = to_single_byte(c);
        if (!byte) return std::nullopt;
        if (*byte >= 0x80) has_high_byte = true;
        bytes += static_cast<char>(*byte);
    }

    if (!has_high_byte || !is_valid_utf8(bytes)) return std::nullopt;
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(bytes.data(), static_cast<int32_t>(bytes.size())));
}

void map_digits_in_place(icu::UnicodeString& text) {
    for (int32_t i = 0; i < text.length(); ++i) {
        const UChar u = text.charAt(i);
        if (u >= kArabicIndicZero && u <= kArabicIndicNine) {
            text.setCharAt(i, static_cast<UChar>(u'0' + (u - kArabicIndicZero)));
        }
    }
}

} // anonymous namespace

// ============================================================================
// TextNormalizer
// ============================================================================

NormalizedText TextNormalizer::normalize(std::string_view raw) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        utils::log::error(std::format("NFC normalizer unavailable ({}), mapping digits only",
                                       u_errorName(status)));
        std::string text = map_arabic_indic_digits(raw);
        const bool repaired = (text != raw);
        return {std::move(text), repaired};
    }

    // Invalid input bytes decode to U+FFFD
    icu::UnicodeString current = icu::UnicodeString::fromUTF8(
        icu::StringPiece(raw.data(), static_cast<int32_t>(raw.size())));

    for (int pass = 0; pass < kMaxPasses; ++pass) {
        icu::UnicodeString next = current;
        if (auto fixed = repair_mojibake(next)) {
            next = std::move(*fixed);
        }

        UErrorCode norm_status = U_ZERO_ERROR;
        icu::UnicodeString composed = nfc->normalize(next, norm_status);
        if (U_FAILURE(norm_status)) {
            utils::log::warn(std::format("NFC normalization failed: {}", u_errorName(norm_status)));
        } else {
            next = std::move(composed);
        }
        map_digits_in_place(next);

        if (next == current) break;
        current = std::move(next);
    }

    std::string out;
    current.toUTF8String(out);
    const bool repaired = (out != raw);
    return {std::move(out), repaired};
}

std::string TextNormalizer::map_arabic_indic_digits(std::string_view utf8) {
    // U+0660..U+0669 encode as D9 A0..D9 A9; 0xD9 is always a lead byte
    std::string out;
    out.reserve(utf8.size());
    for (size_t i = 0; i < utf8.size(); ++i) {
        const auto b = static_cast<unsigned char>(utf8[i]);
        if (b == 0xD9 && i + 1 < utf8.size()) {
            const auto next = static_cast<unsigned char>(utf8[i + 1]);
            if (next >= 0xA0 && next <= 0xA9) {
                out += static_cast<char>('0' + (next - 0xA0));
                ++i;
                continue;
            }
        }
        out += utf8[i];
    }
    return out;
}

} // namespace goldminer
