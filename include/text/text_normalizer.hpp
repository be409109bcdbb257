#pragma once

#include <string>
#include <string_view>

namespace goldminer {

struct NormalizedText {
    std::string text;
    bool repaired = false;   // output differs from input bytes
};

/**
 * @brief Text Normalizer - first stage of every message
 *
 * Steps, repeated until the text stops changing:
 * 1. Best-effort UTF-8 decode (invalid bytes become U+FFFD)
 * 2. Mojibake repair: text whose code points all map back to single
 *    Windows-1252 / Latin-1 bytes, and whose bytes form valid UTF-8,
 *    is re-decoded as UTF-8
 * 3. NFC normalization
 * 4. Arabic-Indic digits U+0660..U+0669 mapped to ASCII 0..9
 *
 * Idempotent: normalize(normalize(x).text).text == normalize(x).text.
 * Never throws for message content.
 */
class TextNormalizer {
public:
    [[nodiscard]] static NormalizedText normalize(std::string_view raw);

    [[nodiscard]] static std::string normalize_text(std::string_view raw) {
        return normalize(raw).text;
    }

    /**
     * @brief Replace Arabic-Indic digits only; every other byte is kept as-is
     */
    [[nodiscard]] static std::string map_arabic_indic_digits(std::string_view utf8);
};

} // namespace goldminer
