/**
 * @file color.hh
 * @brief Colors and the color table used to warm up the atlas.
 *
 * A color table is the ordered list of foreground colors of the active
 * color scheme. Glyph requests refer to entries by index (see
 * encode_foreground()), and the atlas warms up one glyph per entry.
 *
 * Themes usually describe colors as CSS-style hex strings, so this file
 * also provides conversion to and from that notation.
 *
 * @code{.cpp}
 * color_table table = {
 *     parse_hex_color("#000000"),
 *     parse_hex_color("#d4d4d4"),
 *     parse_hex_color("#569cd6"),
 * };
 * @endcode
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief 8-bit per channel RGBA color.
     */
    struct GLYPH_ATLAS_EXPORT rgba_color {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;
        std::uint8_t a = 255;

        /**
         * @brief Format as lowercase hex.
         *
         * Opaque colors produce "#rrggbb", others "#rrggbbaa".
         */
        [[nodiscard]] std::string to_hex() const;

        friend bool operator==(const rgba_color&, const rgba_color&) = default;
    };

    /**
     * @brief Ordered foreground colors of a color scheme.
     */
    using color_table = std::vector<rgba_color>;

    /**
     * @brief Parse a CSS-style hex color.
     *
     * Accepted forms: "#rgb", "#rrggbb" and "#rrggbbaa" (case insensitive).
     *
     * @param text Hex color string
     * @return Parsed color
     * @throws std::invalid_argument if the string is malformed
     */
    GLYPH_ATLAS_EXPORT rgba_color parse_hex_color(std::string_view text);
} // namespace glyph_atlas
