/**
 * @file atlas_page.hh
 * @brief Atlas page concept and the CPU-side page implementation.
 *
 * A page is one fixed-size square texture plus the packing state that
 * decides where glyphs go inside it. The texture_atlas coordinator owns
 * a small number of pages and routes every glyph request to one of them.
 *
 * @section page_concept The Concept
 *
 * An atlas_page must support:
 * - Construction with (index, size, allocator tag)
 * - get_glyph(rasterizer, chars, metadata) returning a stable record
 * - usage_preview() and stats() for diagnostics
 * - index(), size() and clear()
 *
 * @section page_custom GPU Page
 *
 * A GPU backed page keeps the same bookkeeping and uploads the dirty
 * region after writing a glyph:
 *
 * @code{.cpp}
 * class gl_atlas_page {
 * public:
 *     gl_atlas_page(int index, int size, std::string_view allocator);
 *     const atlas_glyph& get_glyph(glyph_rasterizer& r,
 *                                  std::string_view chars,
 *                                  uint32_t metadata) {
 *         // lookup, rasterize, allocate, then
 *         glTextureSubImage2D(m_texture, 0, rect.x, rect.y, rect.w, rect.h,
 *                             GL_RED, GL_UNSIGNED_BYTE, pixels);
 *     }
 *     ...
 * };
 * @endcode
 *
 * @author Igor
 * @date 03/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <glyph_atlas/types.hh>
#include <glyph_atlas/glyph_allocator.hh>
#include <glyph_atlas/glyph_rasterizer.hh>
#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief Concept for atlas page types.
     *
     * @tparam T Type to check against the concept
     *
     * @section atlas_page_requirements Requirements
     *
     * - `T(int, int, std::string_view)` - Constructible with index, size and allocator tag
     * - `page.get_glyph(rasterizer, chars, metadata)` - Returns `const atlas_glyph&`
     * - `page.usage_preview()` - Returns an atlas_image of the page usage
     * - `page.stats()` - Returns human readable statistics
     * - `page.index()`, `page.size()` - Return the construction arguments
     * - `page.clear()` - Drops every glyph
     */
    template<typename T>
    concept atlas_page = std::move_constructible<T> &&
        requires(T& page, const T& cpage, glyph_rasterizer& rasterizer,
                 std::string_view chars, std::uint32_t metadata)
    {
        { T(int{}, int{}, std::string_view{}) };
        { page.get_glyph(rasterizer, chars, metadata) } -> std::same_as<const atlas_glyph&>;
        { cpage.usage_preview() } -> std::same_as<atlas_image>;
        { cpage.stats() } -> std::convertible_to<std::string>;
        { cpage.index() } -> std::convertible_to<int>;
        { cpage.size() } -> std::convertible_to<int>;
        { page.clear() } -> std::same_as<void>;
    };

    /**
     * @brief Atlas page backed by an 8-bit alpha buffer in memory.
     *
     * Glyphs are cached by (rasterizer id, chars, metadata). On a miss
     * the rasterizer produces a bitmap, the allocator places it and the
     * bitmap is copied into the page buffer. The buffer can be uploaded
     * to a GPU texture as a single-channel image.
     *
     * When the allocator runs out of room, get_glyph() throws
     * std::runtime_error. The page never evicts on its own; call clear()
     * to start over.
     *
     * @warning Not thread-safe.
     */
    class GLYPH_ATLAS_EXPORT memory_atlas_page {
    public:
        /**
         * @brief Create an empty page.
         *
         * @param index Page index within the atlas
         * @param size Width and height in pixels
         * @param allocator Packing strategy tag ("slab" or "shelf")
         * @throws std::invalid_argument for a non-positive size or unknown tag
         */
        memory_atlas_page(int index, int size, std::string_view allocator);

        memory_atlas_page(memory_atlas_page&&) noexcept;
        memory_atlas_page& operator=(memory_atlas_page&&) noexcept;
        ~memory_atlas_page();

        /**
         * @brief Get a glyph, rasterizing and packing it on first use.
         *
         * @return Record valid until clear() or destruction
         * @throws std::runtime_error if the page is full
         */
        const atlas_glyph& get_glyph(glyph_rasterizer& rasterizer,
                                     std::string_view chars,
                                     std::uint32_t metadata);

        /// Check whether a glyph is cached, without rasterizing
        [[nodiscard]] bool contains(std::uint32_t rasterizer_id,
                                    std::string_view chars,
                                    std::uint32_t metadata) const;

        [[nodiscard]] int index() const noexcept { return m_index; }
        [[nodiscard]] int size() const noexcept { return m_size; }
        [[nodiscard]] std::size_t glyph_count() const noexcept { return m_glyphs.size(); }

        /// Sum of the areas of all packed glyph bitmaps
        [[nodiscard]] std::size_t used_pixels() const noexcept { return m_used_pixels; }

        [[nodiscard]] const glyph_allocator& allocator() const noexcept { return *m_allocator; }

        /// Row-major alpha buffer of size() * size() bytes
        [[nodiscard]] const std::uint8_t* data() const noexcept { return m_pixels.data(); }

        /// Coverage value at (x, y), 0 when out of bounds
        [[nodiscard]] std::uint8_t pixel(int x, int y) const noexcept;

        /**
         * @brief Render the page usage as an RGBA image.
         *
         * Reserved but unused area is tinted red, glyph cells green and
         * glyph coverage is drawn in white on top.
         */
        [[nodiscard]] atlas_image usage_preview() const;

        /**
         * @brief Human readable usage statistics.
         *
         * @code
         * page0:
         *      Total: 1048576 (1024x1024)
         *       Used: 18432 (1.8%)
         *     Wasted: 4096 (0.39%)
         * Efficiency: 82%
         *     Glyphs: 1280
         *      Slabs: 6 of 256
         * @endcode
         */
        [[nodiscard]] std::string stats() const;

        /// Drop every glyph, reset the allocator and zero the buffer
        void clear();

    private:
        struct glyph_key {
            std::uint32_t rasterizer_id;
            std::string chars;
            std::uint32_t metadata;

            bool operator==(const glyph_key&) const = default;
        };

        struct glyph_key_hash {
            std::size_t operator()(const glyph_key& key) const noexcept;
        };

        void write_bitmap(const glyph_rect& rect, const rasterized_glyph& bitmap);

        int m_index;
        int m_size;
        std::unique_ptr<glyph_allocator> m_allocator;
        std::vector<std::uint8_t> m_pixels;
        std::unordered_map<glyph_key, atlas_glyph, glyph_key_hash> m_glyphs;
        std::size_t m_used_pixels = 0;
    };

    // Verify memory_atlas_page satisfies atlas_page concept
    static_assert(atlas_page<memory_atlas_page>);
} // namespace glyph_atlas
