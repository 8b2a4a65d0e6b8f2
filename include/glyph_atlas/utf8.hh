/**
 * @file utf8.hh
 * @brief UTF-8 decoding of glyph character sequences.
 *
 * Malformed input never stops decoding: a bad or truncated lead byte
 * yields U+FFFD and decoding resumes at the next byte, so valid
 * characters after the error are kept. Overlong forms, surrogates and
 * code points above U+10FFFF decode to U+FFFD as well.
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <cstddef>
#include <string_view>
#include <vector>

namespace glyph_atlas {
    /// Substituted for every malformed sequence
    inline constexpr char32_t utf8_replacement_char = 0xFFFD;

    /**
     * @brief One decoded code point.
     */
    struct utf8_decoded {
        char32_t codepoint = utf8_replacement_char;
        std::size_t length = 0;  ///< Bytes consumed, at least 1 for non-empty input
    };

    /**
     * @brief Decode the code point at the start of a string.
     *
     * @return length 0 only for empty input
     */
    [[nodiscard]] GLYPH_ATLAS_EXPORT utf8_decoded decode_utf8_one(std::string_view str) noexcept;

    /// Decode a whole string
    [[nodiscard]] GLYPH_ATLAS_EXPORT std::vector<char32_t> decode_utf8(std::string_view str);
} // namespace glyph_atlas
