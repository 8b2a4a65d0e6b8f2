/**
 * @file theme_source.hh
 * @brief Color scheme provider and change notification.
 *
 * The atlas keeps a copy of the active color table and refreshes it
 * whenever the theme changes. theme_source is the capability it needs
 * for that; static_theme is a ready-made implementation for hosts that
 * manage the color table themselves.
 *
 * @code{.cpp}
 * static_theme theme({parse_hex_color("#000000"), parse_hex_color("#ffffff")});
 *
 * subscription sub = theme.on_color_theme_change([&] {
 *     redraw_everything(theme.current_color_table());
 * });
 *
 * theme.set_color_table(load_dark_colors());  // listener runs
 * sub.reset();                                // no more notifications
 * @endcode
 *
 * @author Igor
 * @date 04/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <glyph_atlas/color.hh>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace glyph_atlas {
    /**
     * @brief Move-only handle of a listener registration.
     *
     * Destroying the handle or calling reset() removes the listener. The
     * handle may outlive the source it came from.
     */
    class GLYPH_ATLAS_EXPORT subscription {
    public:
        subscription() = default;
        explicit subscription(std::function<void()> unsubscribe);
        ~subscription();

        subscription(subscription&& other) noexcept;
        subscription& operator=(subscription&& other) noexcept;

        subscription(const subscription&) = delete;
        subscription& operator=(const subscription&) = delete;

        /// Remove the listener now
        void reset() noexcept;

        [[nodiscard]] bool active() const noexcept { return static_cast<bool>(m_unsubscribe); }

    private:
        std::function<void()> m_unsubscribe;
    };

    /**
     * @brief Source of the active color table.
     */
    class GLYPH_ATLAS_EXPORT theme_source {
    public:
        using listener = std::function<void()>;

        virtual ~theme_source() = default;

        /// Snapshot of the active color table
        [[nodiscard]] virtual color_table current_color_table() const = 0;

        /**
         * @brief Register a listener called after every color theme change.
         *
         * The listener is not called for the registration itself; callers
         * read current_color_table() right after subscribing.
         */
        [[nodiscard]] virtual subscription on_color_theme_change(listener l) = 0;
    };

    /**
     * @brief Theme whose color table is set by the host.
     */
    class GLYPH_ATLAS_EXPORT static_theme final : public theme_source {
    public:
        explicit static_theme(color_table colors = {});
        ~static_theme() override;

        [[nodiscard]] color_table current_color_table() const override;
        [[nodiscard]] subscription on_color_theme_change(listener l) override;

        /**
         * @brief Replace the color table and notify listeners.
         *
         * Listeners run in subscription order.
         */
        void set_color_table(color_table colors);

        [[nodiscard]] std::size_t listener_count() const noexcept;

    private:
        struct registry {
            std::uint64_t next = 1;
            std::map<std::uint64_t, listener> listeners;
        };

        color_table m_colors;
        std::shared_ptr<registry> m_registry;
    };
} // namespace glyph_atlas
