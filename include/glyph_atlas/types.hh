/**
 * @file types.hh
 * @brief Core types shared by the atlas coordinator, pages and rasterizers.
 *
 * This file defines the small value types that flow between the
 * components of the glyph atlas: rectangles inside a page, the glyph
 * record handed out to renderers, the metadata bitfield layout and
 * the RGBA image used for usage previews.
 *
 * @section types_metadata Metadata Bitfield
 *
 * Every glyph request carries a 32-bit metadata word. The atlas only
 * interprets the foreground color index, everything else is passed
 * through to the page and rasterizer untouched.
 *
 * @code
 *   bit  31        24 23           15 14                      0
 *       +------------+---------------+-------------------------+
 *       | background |  foreground   |  style / token / lang   |
 *       +------------+---------------+-------------------------+
 * @endcode
 *
 * @code{.cpp}
 * uint32_t metadata = encode_foreground(3);
 * assert(decode_foreground(metadata) == 3);
 * @endcode
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <cstdint>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief Bit layout of the glyph metadata word.
     */
    namespace metadata {
        inline constexpr std::uint32_t foreground_offset = 15;
        inline constexpr std::uint32_t foreground_mask = 0x00FF8000u;
        inline constexpr std::uint32_t background_offset = 24;
        inline constexpr std::uint32_t background_mask = 0xFF000000u;
    } // namespace metadata

    /**
     * @brief Pack a foreground color index into a metadata word.
     *
     * Indices that do not fit in the foreground field are truncated
     * by the mask.
     */
    [[nodiscard]] constexpr std::uint32_t encode_foreground(std::uint32_t color_index) noexcept {
        return (color_index << metadata::foreground_offset) & metadata::foreground_mask;
    }

    /// Extract the foreground color index from a metadata word
    [[nodiscard]] constexpr std::uint32_t decode_foreground(std::uint32_t value) noexcept {
        return (value & metadata::foreground_mask) >> metadata::foreground_offset;
    }

    /**
     * @brief Axis-aligned rectangle inside an atlas page.
     */
    struct GLYPH_ATLAS_EXPORT glyph_rect {
        int x = 0;  ///< Left edge X coordinate
        int y = 0;  ///< Top edge Y coordinate
        int w = 0;  ///< Width in pixels
        int h = 0;  ///< Height in pixels

        [[nodiscard]] bool empty() const noexcept { return w <= 0 || h <= 0; }

        [[nodiscard]] bool intersects(const glyph_rect& other) const noexcept {
            return x < other.x + other.w && other.x < x + w &&
                   y < other.y + other.h && other.y < y + h;
        }

        friend bool operator==(const glyph_rect&, const glyph_rect&) = default;
    };

    /**
     * @brief A glyph stored in an atlas page.
     *
     * This is the record renderers sample from: which page holds the
     * bitmap, where in that page it lives, and how to place it relative
     * to the pen position.
     *
     * @code
     *   pen ----> +
     *             |  origin_offset_y
     *             v
     *   origin_offset_x
     *   |<-->+--------+
     *        | glyph  | rect.h
     *        +--------+
     *          rect.w
     * @endcode
     *
     * Records are owned by the page and handed out by const reference.
     * They remain valid until the page is cleared or destroyed.
     */
    struct GLYPH_ATLAS_EXPORT atlas_glyph {
        int page_index = 0;           ///< Index of the page holding the bitmap
        int glyph_index = 0;          ///< Insertion order within the page
        glyph_rect rect;              ///< Region of the page surface
        int origin_offset_x = 0;      ///< Pen X to bitmap left edge
        int origin_offset_y = 0;      ///< Pen Y (baseline) to bitmap top edge
        std::uint32_t metadata = 0;   ///< Metadata of the originating request
    };

    /**
     * @brief Simple RGBA8 image, row-major, no padding.
     */
    struct GLYPH_ATLAS_EXPORT atlas_image {
        int width = 0;
        int height = 0;
        std::vector<std::uint8_t> pixels; ///< width * height * 4 bytes

        [[nodiscard]] std::size_t offset(int x, int y) const noexcept {
            return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                    static_cast<std::size_t>(x)) * 4u;
        }
    };
} // namespace glyph_atlas
