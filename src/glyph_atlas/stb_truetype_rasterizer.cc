//
// Created by igor on 02/01/2026.
//

#include <glyph_atlas/stb_truetype_rasterizer.hh>
#include <glyph_atlas/utf8.hh>
#include <failsafe/exception.hh>
#include <algorithm>
#include <climits>
#include <cmath>
#include <vector>

// Disable warnings for stb_truetype (third-party header)
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wdouble-promotion"
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#ifdef __clang__
#pragma clang diagnostic ignored "-Wdeprecated-anon-enum-enum-conversion"
#endif
#endif

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

namespace glyph_atlas {
    namespace {
        struct placed_glyph {
            int glyph = 0;
            int x0 = 0;
            int y0 = 0;
            int x1 = 0;
            int y1 = 0;
        };
    } // anonymous namespace

    struct stb_truetype_rasterizer::impl {
        std::vector<std::uint8_t> data;
        stbtt_fontinfo font_info{};
        float pixel_height = 0.0f;
        float scale = 0.0f;
    };

    stb_truetype_rasterizer::stb_truetype_rasterizer(std::span<const std::uint8_t> font_data,
                                                     float pixel_height,
                                                     int font_index)
        : m_impl(std::make_unique<impl>()) {
        THROW_IF(pixel_height <= 0.0f, std::invalid_argument, "Pixel height must be positive:", pixel_height);
        THROW_IF(font_data.empty(), std::runtime_error, "Empty font data");

        m_impl->data.assign(font_data.begin(), font_data.end());
        int offset = stbtt_GetFontOffsetForIndex(m_impl->data.data(), font_index);
        THROW_IF(offset < 0, std::runtime_error, "Font index", font_index, "not found in font data");
        THROW_IF(stbtt_InitFont(&m_impl->font_info, m_impl->data.data(), offset) == 0,
                 std::runtime_error, "Failed to initialize TrueType font");

        m_impl->pixel_height = pixel_height;
        m_impl->scale = stbtt_ScaleForPixelHeight(&m_impl->font_info, pixel_height);
    }

    stb_truetype_rasterizer::~stb_truetype_rasterizer() = default;

    float stb_truetype_rasterizer::pixel_height() const noexcept {
        return m_impl->pixel_height;
    }

    rasterized_glyph stb_truetype_rasterizer::rasterize_glyph(std::string_view chars, std::uint32_t) {
        const float scale = m_impl->scale;
        stbtt_fontinfo* info = &m_impl->font_info;

        std::vector<placed_glyph> placed;
        int min_x = INT_MAX;
        int min_y = INT_MAX;
        int max_x = INT_MIN;
        int max_y = INT_MIN;

        float pen_x = 0.0f;
        int prev_glyph = 0;

        for (char32_t cp : decode_utf8(chars)) {
            int glyph = stbtt_FindGlyphIndex(info, static_cast<int>(cp));
            if (prev_glyph != 0 && glyph != 0) {
                pen_x += static_cast<float>(stbtt_GetGlyphKernAdvance(info, prev_glyph, glyph)) * scale;
            }

            int advance_width = 0;
            int left_bearing = 0;
            stbtt_GetGlyphHMetrics(info, glyph, &advance_width, &left_bearing);

            if (glyph != 0) {
                int x0, y0, x1, y1;
                stbtt_GetGlyphBitmapBox(info, glyph, scale, scale, &x0, &y0, &x1, &y1);
                if (x1 > x0 && y1 > y0) {
                    int pen = static_cast<int>(std::lround(pen_x));
                    placed_glyph p{glyph, pen + x0, y0, pen + x1, y1};
                    min_x = std::min(min_x, p.x0);
                    min_y = std::min(min_y, p.y0);
                    max_x = std::max(max_x, p.x1);
                    max_y = std::max(max_y, p.y1);
                    placed.push_back(p);
                }
            }

            pen_x += static_cast<float>(advance_width) * scale;
            prev_glyph = glyph;
        }

        rasterized_glyph result;
        if (placed.empty()) {
            return result;
        }

        result.width = max_x - min_x;
        result.height = max_y - min_y;
        result.origin_offset_x = min_x;
        result.origin_offset_y = min_y;
        // Cast to size_t before multiplication to prevent integer overflow
        result.pixels.assign(static_cast<std::size_t>(result.width) * static_cast<std::size_t>(result.height), 0);

        for (const auto& p : placed) {
            std::size_t dst = static_cast<std::size_t>(p.y0 - min_y) * static_cast<std::size_t>(result.width) +
                              static_cast<std::size_t>(p.x0 - min_x);
            stbtt_MakeGlyphBitmap(info, result.pixels.data() + dst,
                                  p.x1 - p.x0, p.y1 - p.y0, result.width,
                                  scale, scale, p.glyph);
        }

        return result;
    }
} // namespace glyph_atlas
