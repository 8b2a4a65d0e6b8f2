/**
 * @file display_environment.hh
 * @brief Display queries the atlas needs at construction time.
 *
 * @author Igor
 * @date 04/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>

namespace glyph_atlas {
    /**
     * @brief Read-only view of the display the atlas renders to.
     */
    class GLYPH_ATLAS_EXPORT display_environment {
    public:
        virtual ~display_environment() = default;

        /// Physical pixels per logical pixel (1.0 on standard displays, 2.0 on HiDPI)
        [[nodiscard]] virtual double device_pixel_ratio() const = 0;
    };

    /**
     * @brief Display with a known, constant pixel ratio.
     */
    class GLYPH_ATLAS_EXPORT fixed_display final : public display_environment {
    public:
        explicit fixed_display(double ratio = 1.0) noexcept
            : m_ratio(ratio) {
        }

        [[nodiscard]] double device_pixel_ratio() const override { return m_ratio; }

    private:
        double m_ratio;
    };
} // namespace glyph_atlas
