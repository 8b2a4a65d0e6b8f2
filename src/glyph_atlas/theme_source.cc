//
// Created by igor on 04/01/2026.
//

#include <glyph_atlas/theme_source.hh>
#include <failsafe/logger.hh>
#include <utility>
#include <vector>

namespace glyph_atlas {
    // =============================================================================
    // subscription
    // =============================================================================
    subscription::subscription(std::function<void()> unsubscribe)
        : m_unsubscribe(std::move(unsubscribe)) {
    }

    subscription::~subscription() {
        reset();
    }

    subscription::subscription(subscription&& other) noexcept
        : m_unsubscribe(std::exchange(other.m_unsubscribe, nullptr)) {
    }

    subscription& subscription::operator=(subscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_unsubscribe = std::exchange(other.m_unsubscribe, nullptr);
        }
        return *this;
    }

    void subscription::reset() noexcept {
        if (m_unsubscribe) {
            auto unsubscribe = std::exchange(m_unsubscribe, nullptr);
            unsubscribe();
        }
    }

    // =============================================================================
    // static_theme
    // =============================================================================
    static_theme::static_theme(color_table colors)
        : m_colors(std::move(colors))
          , m_registry(std::make_shared<registry>()) {
    }

    static_theme::~static_theme() = default;

    color_table static_theme::current_color_table() const {
        return m_colors;
    }

    subscription static_theme::on_color_theme_change(listener l) {
        const std::uint64_t id = m_registry->next++;
        m_registry->listeners.emplace(id, std::move(l));

        std::weak_ptr<registry> weak = m_registry;
        return subscription([weak, id] {
            if (auto reg = weak.lock()) {
                reg->listeners.erase(id);
            }
        });
    }

    void static_theme::set_color_table(color_table colors) {
        m_colors = std::move(colors);
        LOG_DEBUG("Color theme changed:", m_colors.size(), "colors");

        // Listeners may unsubscribe while being notified
        std::vector<std::uint64_t> ids;
        ids.reserve(m_registry->listeners.size());
        for (const auto& [id, l] : m_registry->listeners) {
            ids.push_back(id);
        }
        for (auto id : ids) {
            auto it = m_registry->listeners.find(id);
            if (it != m_registry->listeners.end()) {
                auto l = it->second;
                l();
            }
        }
    }

    std::size_t static_theme::listener_count() const noexcept {
        return m_registry->listeners.size();
    }
} // namespace glyph_atlas
