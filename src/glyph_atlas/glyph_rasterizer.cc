//
// Created by igor on 02/01/2026.
//

#include <glyph_atlas/glyph_rasterizer.hh>
#include <atomic>

namespace glyph_atlas {
    namespace {
        std::atomic<std::uint32_t> s_next_id{1};
    }

    glyph_rasterizer::glyph_rasterizer()
        : m_id(s_next_id.fetch_add(1, std::memory_order_relaxed)) {
    }

    glyph_rasterizer::~glyph_rasterizer() = default;
} // namespace glyph_atlas
