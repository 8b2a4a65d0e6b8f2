/**
 * @file stb_truetype_rasterizer.hh
 * @brief TrueType/OpenType glyph rasterizer backed by stb_truetype.
 *
 * @section stb_rasterizer_usage Usage
 *
 * @code{.cpp}
 * std::vector<uint8_t> font_data = read_file("DejaVuSansMono.ttf");
 * stb_truetype_rasterizer rasterizer(font_data, 16.0f);
 *
 * rasterized_glyph g = rasterizer.rasterize_glyph("A", 0);
 * // g.pixels holds g.width * g.height coverage values
 * @endcode
 *
 * @section stb_rasterizer_sequences Character Sequences
 *
 * The character sequence is decoded as UTF-8 and every codepoint is
 * drawn on a shared baseline, advancing the pen and applying kerning.
 * Codepoints missing from the font advance the pen but draw nothing.
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <glyph_atlas/glyph_rasterizer.hh>
#include <cstdint>
#include <memory>
#include <span>

namespace glyph_atlas {
    /**
     * @brief Glyph rasterizer for TTF/OTF/TTC fonts.
     *
     * The font data is copied, so the caller's buffer may be released
     * after construction.
     */
    class GLYPH_ATLAS_EXPORT stb_truetype_rasterizer final : public glyph_rasterizer {
    public:
        /**
         * @brief Load a font.
         *
         * @param font_data Font file contents
         * @param pixel_height Rasterization height in pixels
         * @param font_index Index within a TTC collection (0 otherwise)
         * @throws std::invalid_argument if pixel_height is not positive
         * @throws std::runtime_error if the data is not a usable font
         */
        stb_truetype_rasterizer(std::span<const std::uint8_t> font_data,
                                float pixel_height,
                                int font_index = 0);

        ~stb_truetype_rasterizer() override;

        [[nodiscard]] float pixel_height() const noexcept;

        rasterized_glyph rasterize_glyph(std::string_view chars, std::uint32_t metadata) override;

    private:
        struct impl;
        std::unique_ptr<impl> m_impl;
    };
} // namespace glyph_atlas
