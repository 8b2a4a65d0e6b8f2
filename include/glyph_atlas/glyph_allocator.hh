/**
 * @file glyph_allocator.hh
 * @brief Packing strategies that place glyph bitmaps inside a page.
 *
 * An allocator only does bookkeeping: it hands out rectangles of a
 * fixed width x height area and never touches pixels. Pages pick the
 * allocator by tag when they are created.
 *
 * | Tag     | Class           | Strategy |
 * |---------|-----------------|----------|
 * | "shelf" | shelf_allocator | Rows filled left to right, new row below |
 * | "slab"  | slab_allocator  | Equal-size glyphs share a block split into cells |
 *
 * @section allocator_shelf Shelf Packing
 *
 * @code
 *   +---+---+-----+--+----------+
 *   | A | B |  C  |D |          |  <- shelf 0 (height = tallest glyph)
 *   +---+---+-----+--+----------+
 *   | E    | F | G |            |  <- shelf 1
 *   +------+---+---+            |
 *   |                           |
 *   +---------------------------+
 * @endcode
 *
 * @section allocator_slab Slab Packing
 *
 * @code
 *   +-----------+-----------+---------+
 *   |a|b|c|d|e|f|A |B |C |D |         |  <- slabs of 64x64, one per glyph size
 *   |g|h|i|j|k|l|E |F |G |  |         |
 *   +-----------+-----------+         |
 *   |                                 |
 *   +---------------------------------+
 * @endcode
 *
 * Slabs waste the unused cells of each block but keep glyphs of the
 * same size together, which suits monospace text where most glyphs of
 * a font share a cell size.
 *
 * @author Igor
 * @date 03/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <glyph_atlas/types.hh>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief Base class for page packing strategies.
     */
    class GLYPH_ATLAS_EXPORT glyph_allocator {
    public:
        glyph_allocator(int width, int height);
        virtual ~glyph_allocator();

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }

        /**
         * @brief Reserve a region for a glyph.
         *
         * @param w Glyph width in pixels (> 0)
         * @param h Glyph height in pixels (> 0)
         * @return Region of the page, or nullopt when the page has no room
         */
        virtual std::optional<glyph_rect> allocate(int w, int h) = 0;

        /// Forget every allocation
        virtual void reset() = 0;

        /// Tag this allocator is selected by
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * @brief Regions claimed from the page so far.
         *
         * For a shelf allocator these are the shelves, for a slab allocator
         * the slab blocks. Glyphs live inside them; the rest is waste.
         */
        [[nodiscard]] virtual std::vector<glyph_rect> reserved_regions() const = 0;

        /// Total area of reserved_regions()
        [[nodiscard]] std::size_t reserved_pixels() const;

        /// Allocator-specific statistics lines (each ending in '\n')
        [[nodiscard]] virtual std::string describe() const = 0;

    private:
        int m_width;
        int m_height;
    };

    /**
     * @brief Row based packing.
     */
    class GLYPH_ATLAS_EXPORT shelf_allocator final : public glyph_allocator {
    public:
        shelf_allocator(int width, int height, int padding = 1);

        std::optional<glyph_rect> allocate(int w, int h) override;
        void reset() override;
        [[nodiscard]] std::string_view name() const noexcept override { return "shelf"; }
        [[nodiscard]] std::vector<glyph_rect> reserved_regions() const override;
        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] std::size_t shelf_count() const noexcept { return m_shelves.size(); }

    private:
        struct shelf {
            int y = 0;      // top edge
            int height = 0; // tallest glyph so far
            int x = 0;      // next free x
        };

        int m_padding;
        std::vector<shelf> m_shelves;
    };

    /**
     * @brief Size-class packing into fixed blocks.
     *
     * Glyphs larger than the slab size get a block rounded up to the
     * next multiple of the slab size in each dimension.
     */
    class GLYPH_ATLAS_EXPORT slab_allocator final : public glyph_allocator {
    public:
        slab_allocator(int width, int height, int slab_size = 64);

        std::optional<glyph_rect> allocate(int w, int h) override;
        void reset() override;
        [[nodiscard]] std::string_view name() const noexcept override { return "slab"; }
        [[nodiscard]] std::vector<glyph_rect> reserved_regions() const override;
        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] int slab_size() const noexcept { return m_slab_size; }
        [[nodiscard]] std::size_t slab_count() const noexcept { return m_slabs.size(); }

        /// Number of standard slabs the page can hold
        [[nodiscard]] std::size_t slab_capacity() const noexcept;

    private:
        struct slab {
            glyph_rect block;
            int cell_w = 0;
            int cell_h = 0;
            int columns = 0;
            int capacity = 0;
            int count = 0;
        };

        int m_slab_size;
        shelf_allocator m_blocks;
        std::vector<slab> m_slabs;
        std::map<std::pair<int, int>, std::size_t> m_open; // cell size -> slab with free cells
    };

    /**
     * @brief Create an allocator by tag.
     *
     * @param tag "slab" or "shelf"
     * @param width Page width
     * @param height Page height
     * @throws std::invalid_argument for an unknown tag
     */
    GLYPH_ATLAS_EXPORT std::unique_ptr<glyph_allocator> make_glyph_allocator(std::string_view tag,
                                                                             int width, int height);
} // namespace glyph_atlas
