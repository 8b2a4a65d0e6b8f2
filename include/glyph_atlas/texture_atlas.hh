/**
 * @file texture_atlas.hh
 * @brief Atlas coordinator routing glyph requests to texture pages.
 *
 * This file provides the texture_atlas class template, the single entry
 * point renderers use to obtain glyphs. It owns a fixed set of pages,
 * decides which page holds a glyph, and warms the cache up in the
 * background the first time it sees a rasterizer.
 *
 * @section atlas_architecture Architecture
 *
 * @code
 *   renderer
 *      |  get_glyph(rasterizer, chars, metadata)
 *      v
 * +----------------+   first use of a rasterizer   +-----------------+
 * | texture_atlas  | ----------------------------> | idle_task_queue |
 * +----------------+                               +-----------------+
 *      |  router(chars)                                   |
 *      +--------------------+                             | get_glyph(...) per
 *      v                    v                             | character x color
 * +--------+           +--------+                         |
 * | Page 0 |           | Page 1 | <-----------------------+
 * +--------+           +--------+
 * @endcode
 *
 * @section atlas_sizing Page Size
 *
 * page_size = min(base_page_size * max(1, floor(device_pixel_ratio)), max_texture_size)
 *
 * @section atlas_warm_up Warm-up
 *
 * The first request for a rasterizer enqueues one idle task per printable
 * ASCII character, uppercase first, then lowercase, then the whole range
 * 33-126. Each task requests the character once per entry of the color
 * table. Only one warm-up runs at a time: a new rasterizer drops the
 * pending tasks of the previous one.
 *
 * @section atlas_usage Usage
 *
 * @code{.cpp}
 * static_theme theme(load_token_colors());
 * manual_idle_scheduler scheduler;
 * fixed_display display(2.0);
 *
 * texture_atlas<memory_atlas_page> atlas(max_texture_size, theme, scheduler, display);
 * stb_truetype_rasterizer rasterizer(font_data, 14.0f);
 *
 * const atlas_glyph& g = atlas.get_glyph(rasterizer, "A", encode_foreground(4));
 * const auto& page = atlas.pages()[g.page_index];
 * // sample page at g.rect, place at pen + (g.origin_offset_x, g.origin_offset_y)
 *
 * // once per frame, after presenting
 * scheduler.run_idle(std::chrono::milliseconds(2));
 * @endcode
 *
 * @author Igor
 * @date 05/01/2026
 */

#pragma once

#include <glyph_atlas/types.hh>
#include <glyph_atlas/color.hh>
#include <glyph_atlas/atlas_page.hh>
#include <glyph_atlas/glyph_rasterizer.hh>
#include <glyph_atlas/idle_task_queue.hh>
#include <glyph_atlas/theme_source.hh>
#include <glyph_atlas/display_environment.hh>
#include <failsafe/exception.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glyph_atlas {
    /**
     * @brief Default routing rule.
     *
     * Sequences containing at least one ASCII letter go to page 0,
     * everything else to page 1.
     */
    [[nodiscard]] inline std::size_t default_page_router(std::string_view chars) noexcept {
        const bool has_letter = std::any_of(chars.begin(), chars.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        });
        return has_letter ? 0 : 1;
    }

    /**
     * @brief Configuration for texture_atlas.
     */
    struct texture_atlas_config {
        /**
         * @brief Page size at a pixel ratio of 1.
         *
         * Scaled by the integer pixel ratio and clamped to the hardware
         * maximum texture size.
         */
        int base_page_size = 1024;

        /**
         * @brief Packing strategy tag passed to every page.
         */
        std::string allocator = "slab";

        /**
         * @brief Clear all pages when the color theme changes.
         *
         * Off by default: glyph records refer to colors by index, so they
         * stay valid for renderers that resolve the index through the live
         * color table. Turn it on when pages bake colors into their pixels.
         * Clearing invalidates every previously returned record.
         */
        bool clear_on_theme_change = false;

        /**
         * @brief Maps a character sequence to a page index.
         *
         * Must return a value below texture_atlas::page_count.
         * An empty function selects default_page_router().
         */
        std::function<std::size_t(std::string_view)> router = default_page_router;
    };

    /**
     * @brief Coordinator of the atlas pages.
     *
     * @tparam Page Page type (must satisfy atlas_page concept)
     *
     * @warning Not thread-safe. Use from the thread that pumps the idle
     *          scheduler. Rasterizers passed to get_glyph() must outlive
     *          their pending warm-up tasks; destroying the atlas or
     *          warming up another rasterizer releases them.
     */
    template<atlas_page Page>
    class texture_atlas {
    public:
        /// Number of pages, fixed for the lifetime of the atlas
        static constexpr std::size_t page_count = 2;

        /**
         * @brief Create the atlas and its pages.
         *
         * @param max_texture_size Largest texture dimension the GPU supports
         * @param theme Source of the color table (must outlive the atlas)
         * @param scheduler Idle scheduler for warm-up (must outlive the atlas)
         * @param display Queried once for the pixel ratio
         * @param config Atlas configuration
         * @throws std::invalid_argument for non-positive sizes
         */
        texture_atlas(int max_texture_size,
                      theme_source& theme,
                      idle_scheduler& scheduler,
                      const display_environment& display,
                      texture_atlas_config config = {})
            : m_theme(theme)
              , m_scheduler(scheduler)
              , m_config(std::move(config)) {
            THROW_IF(max_texture_size <= 0, std::invalid_argument,
                     "Maximum texture size must be positive:", max_texture_size);
            THROW_IF(m_config.base_page_size <= 0, std::invalid_argument,
                     "Base page size must be positive:", m_config.base_page_size);
            if (!m_config.router) {
                m_config.router = default_page_router;
            }

            m_theme_subscription = m_theme.on_color_theme_change([this] {
                on_color_theme_change();
            });
            m_colors = std::make_shared<const color_table>(m_theme.current_color_table());

            double ratio = display.device_pixel_ratio();
            if (!(ratio >= 1.0)) {
                ratio = 1.0;
            }
            // Clamp in floating point, huge or infinite ratios must not overflow
            const double scaled = static_cast<double>(m_config.base_page_size) * std::floor(ratio);
            m_page_size = scaled >= static_cast<double>(max_texture_size)
                              ? max_texture_size
                              : static_cast<int>(scaled);

            m_pages.reserve(page_count);
            for (std::size_t i = 0; i < page_count; ++i) {
                m_pages.emplace_back(static_cast<int>(i), m_page_size, std::string_view(m_config.allocator));
            }

            LOG_INFO("Texture atlas created:", page_count, "pages of", m_page_size, "x", m_page_size,
                     "allocator", m_config.allocator, "pixel ratio", ratio);
        }

        ~texture_atlas() {
            dispose();
        }

        texture_atlas(const texture_atlas&) = delete;
        texture_atlas& operator=(const texture_atlas&) = delete;
        texture_atlas(texture_atlas&&) = delete;
        texture_atlas& operator=(texture_atlas&&) = delete;

        /**
         * @brief Get a glyph, rasterizing it into a page if needed.
         *
         * The first call for a rasterizer also schedules its warm-up.
         * Errors raised by the page (for example a full page) propagate
         * unchanged.
         *
         * @param rasterizer Rasterizer producing the bitmap on a miss
         * @param chars UTF-8 character sequence
         * @param metadata Metadata bitfield (see encode_foreground())
         * @return Record owned by the page
         * @throws std::logic_error after dispose()
         * @throws std::out_of_range if the router picks a missing page
         */
        const atlas_glyph& get_glyph(glyph_rasterizer& rasterizer,
                                     std::string_view chars,
                                     std::uint32_t metadata) {
            THROW_IF(m_pages.empty(), std::logic_error, "Texture atlas used after dispose");

            if (!m_warmed_up.contains(rasterizer.id())) {
                warm_up(rasterizer);
                m_warmed_up.insert(rasterizer.id());
            }

            const std::size_t target = m_config.router(chars);
            THROW_IF(target >= m_pages.size(), std::out_of_range,
                     "Page router selected page", target, "of", m_pages.size());
            return m_pages[target].get_glyph(rasterizer, chars, metadata);
        }

        /// Usage preview of every page, in page order
        [[nodiscard]] std::vector<atlas_image> usage_previews() const {
            std::vector<atlas_image> previews;
            previews.reserve(m_pages.size());
            for (const auto& page : m_pages) {
                previews.push_back(page.usage_preview());
            }
            return previews;
        }

        /// Statistics of every page, in page order
        [[nodiscard]] std::vector<std::string> stats() const {
            std::vector<std::string> result;
            result.reserve(m_pages.size());
            for (const auto& page : m_pages) {
                result.emplace_back(page.stats());
            }
            return result;
        }

        /// Pages in index order (empty after dispose())
        [[nodiscard]] const std::vector<Page>& pages() const noexcept { return m_pages; }

        [[nodiscard]] int page_size() const noexcept { return m_page_size; }

        /// Whether warm-up was scheduled for the rasterizer id
        [[nodiscard]] bool is_warmed_up(std::uint32_t rasterizer_id) const {
            return m_warmed_up.contains(rasterizer_id);
        }

        /// Warm-up tasks not yet run
        [[nodiscard]] std::size_t pending_warm_up_tasks() const noexcept {
            return m_warm_up ? m_warm_up->pending() : 0;
        }

        /// Current color table
        [[nodiscard]] std::shared_ptr<const color_table> colors() const noexcept { return m_colors; }

        [[nodiscard]] const texture_atlas_config& config() const noexcept { return m_config; }

        /**
         * @brief Release the pages and stop all background work.
         *
         * Cancels the warm-up, unsubscribes from the theme and destroys the
         * pages. Safe to call more than once; also run by the destructor.
         */
        void dispose() noexcept {
            if (m_warm_up) {
                m_warm_up->clear();
                m_warm_up.reset();
            }
            m_theme_subscription.reset();
            if (!m_pages.empty()) {
                m_pages.clear();
                LOG_DEBUG("Texture atlas disposed");
            }
        }

    private:
        theme_source& m_theme;
        idle_scheduler& m_scheduler;
        texture_atlas_config m_config;
        int m_page_size = 0;

        std::vector<Page> m_pages;
        std::set<std::uint32_t> m_warmed_up;
        std::shared_ptr<const color_table> m_colors;
        std::unique_ptr<idle_task_queue> m_warm_up;
        subscription m_theme_subscription;

        void on_color_theme_change() {
            m_colors = std::make_shared<const color_table>(m_theme.current_color_table());
            LOG_DEBUG("Texture atlas color table replaced:", m_colors->size(), "colors");
            if (m_config.clear_on_theme_change) {
                for (auto& page : m_pages) {
                    page.clear();
                }
            }
        }

        /// Replace any running warm-up with one for this rasterizer
        void warm_up(glyph_rasterizer& rasterizer) {
            if (m_warm_up) {
                LOG_DEBUG("Dropping", m_warm_up->pending(), "pending warm-up tasks");
                m_warm_up->clear();
            }
            m_warm_up = std::make_unique<idle_task_queue>(m_scheduler);

            LOG_DEBUG("Warming up texture atlas for rasterizer", rasterizer.id());

            // Roughly the larger glyphs first to help the allocator
            for (char code = 'A'; code <= 'Z'; ++code) {
                enqueue_warm_up(rasterizer, code);
            }
            for (char code = 'a'; code <= 'z'; ++code) {
                enqueue_warm_up(rasterizer, code);
            }
            // Remaining printable ASCII
            for (char code = 33; code <= 126; ++code) {
                enqueue_warm_up(rasterizer, code);
            }
        }

        void enqueue_warm_up(glyph_rasterizer& rasterizer, char code) {
            m_warm_up->enqueue([this, &rasterizer, code] {
                // Snapshot: a theme change mid-task does not mix tables
                const std::shared_ptr<const color_table> colors = m_colors;
                const std::string chars(1, code);
                for (std::size_t i = 0; i < colors->size(); ++i) {
                    get_glyph(rasterizer, chars, encode_foreground(static_cast<std::uint32_t>(i)));
                }
            });
        }
    };
} // namespace glyph_atlas
