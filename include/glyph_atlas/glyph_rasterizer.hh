/**
 * @file glyph_rasterizer.hh
 * @brief Abstract glyph rasterizer consumed by atlas pages.
 *
 * A rasterizer turns a short character sequence into an 8-bit coverage
 * bitmap. Pages call it on a cache miss; the atlas coordinator only uses
 * its id() to partition the cache and to warm up each rasterizer once.
 *
 * @section rasterizer_identity Identity
 *
 * Every rasterizer instance receives a unique, stable id when it is
 * constructed. Two rasterizers for the same font and size are still
 * distinct cache partitions.
 *
 * @section rasterizer_custom Custom Rasterizer
 *
 * @code{.cpp}
 * class box_rasterizer : public glyph_rasterizer {
 * public:
 *     rasterized_glyph rasterize_glyph(std::string_view chars,
 *                                      uint32_t metadata) override {
 *         rasterized_glyph g;
 *         g.width = 8;
 *         g.height = 12;
 *         g.origin_offset_y = -12;
 *         g.pixels.assign(8 * 12, 255);
 *         return g;
 *     }
 * };
 * @endcode
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <cstdint>
#include <string_view>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief Output of a single rasterization call.
     *
     * Pixels are 8-bit coverage values in row-major order with a stride
     * equal to width. An empty bitmap (width or height of zero) is valid
     * and denotes an invisible glyph such as a space.
     */
    struct GLYPH_ATLAS_EXPORT rasterized_glyph {
        std::vector<std::uint8_t> pixels;
        int width = 0;
        int height = 0;
        int origin_offset_x = 0; ///< Pen X to bitmap left edge
        int origin_offset_y = 0; ///< Baseline to bitmap top edge (negative is up)

        [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }
    };

    /**
     * @brief Base class for glyph bitmap producers.
     */
    class GLYPH_ATLAS_EXPORT glyph_rasterizer {
    public:
        glyph_rasterizer();
        virtual ~glyph_rasterizer();

        glyph_rasterizer(const glyph_rasterizer&) = delete;
        glyph_rasterizer& operator=(const glyph_rasterizer&) = delete;

        /**
         * @brief Stable identity of this rasterizer.
         *
         * Ids start at 1 and are never reused within a process.
         */
        [[nodiscard]] std::uint32_t id() const noexcept { return m_id; }

        /**
         * @brief Rasterize a character sequence.
         *
         * @param chars UTF-8 encoded characters (usually one grapheme)
         * @param metadata Request metadata (see types.hh)
         * @return Coverage bitmap and placement
         */
        virtual rasterized_glyph rasterize_glyph(std::string_view chars, std::uint32_t metadata) = 0;

    private:
        std::uint32_t m_id;
    };
} // namespace glyph_atlas
