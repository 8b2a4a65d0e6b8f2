//
// Created by igor on 03/01/2026.
//

#include <glyph_atlas/glyph_allocator.hh>
#include <failsafe/enforce.hh>
#include <failsafe/exception.hh>
#include <algorithm>
#include <sstream>

namespace glyph_atlas {
    namespace {
        int round_up(int value, int multiple) {
            return ((value + multiple - 1) / multiple) * multiple;
        }
    }

    // =============================================================================
    // glyph_allocator
    // =============================================================================
    glyph_allocator::glyph_allocator(int width, int height)
        : m_width(width), m_height(height) {
        THROW_IF(width <= 0 || height <= 0, std::invalid_argument,
                 "Allocator dimensions must be positive:", width, "x", height);
    }

    glyph_allocator::~glyph_allocator() = default;

    std::size_t glyph_allocator::reserved_pixels() const {
        std::size_t total = 0;
        for (const auto& r : reserved_regions()) {
            total += static_cast<std::size_t>(r.w) * static_cast<std::size_t>(r.h);
        }
        return total;
    }

    // =============================================================================
    // shelf_allocator
    // =============================================================================
    shelf_allocator::shelf_allocator(int width, int height, int padding)
        : glyph_allocator(width, height), m_padding(padding) {
        THROW_IF(padding < 0, std::invalid_argument, "Padding must not be negative:", padding);
    }

    std::optional<glyph_rect> shelf_allocator::allocate(int w, int h) {
        ENFORCE(w > 0 && h > 0);

        // Can never fit, regardless of state
        if (w + 2 * m_padding > width() || h + 2 * m_padding > height()) {
            return std::nullopt;
        }

        // Move to a new shelf if the glyph does not fit horizontally
        if (m_shelves.empty() || m_shelves.back().x + w + m_padding > width()) {
            int y = m_padding;
            if (!m_shelves.empty()) {
                const auto& last = m_shelves.back();
                y = last.y + last.height + m_padding;
            }
            if (y + h + m_padding > height()) {
                return std::nullopt;
            }
            m_shelves.push_back({y, 0, m_padding});
        }

        shelf& s = m_shelves.back();
        if (s.y + h + m_padding > height()) {
            return std::nullopt;
        }

        glyph_rect rect{s.x, s.y, w, h};
        s.x += w + m_padding;
        s.height = std::max(s.height, h);
        return rect;
    }

    void shelf_allocator::reset() {
        m_shelves.clear();
    }

    std::vector<glyph_rect> shelf_allocator::reserved_regions() const {
        std::vector<glyph_rect> regions;
        regions.reserve(m_shelves.size());
        for (const auto& s : m_shelves) {
            regions.push_back({0, s.y, s.x, s.height});
        }
        return regions;
    }

    std::string shelf_allocator::describe() const {
        std::ostringstream os;
        os << "   Shelves: " << m_shelves.size() << '\n';
        return os.str();
    }

    // =============================================================================
    // slab_allocator
    // =============================================================================
    slab_allocator::slab_allocator(int width, int height, int slab_size)
        : glyph_allocator(width, height)
          , m_slab_size(slab_size)
          , m_blocks(width, height, 0) {
        THROW_IF(slab_size <= 0, std::invalid_argument, "Slab size must be positive:", slab_size);
    }

    std::optional<glyph_rect> slab_allocator::allocate(int w, int h) {
        ENFORCE(w > 0 && h > 0);

        const auto key = std::make_pair(w, h);
        auto it = m_open.find(key);
        if (it == m_open.end() || m_slabs[it->second].count == m_slabs[it->second].capacity) {
            auto block = m_blocks.allocate(round_up(w, m_slab_size), round_up(h, m_slab_size));
            if (!block) {
                return std::nullopt;
            }

            slab s;
            s.block = *block;
            s.cell_w = w;
            s.cell_h = h;
            s.columns = block->w / w;
            s.capacity = s.columns * (block->h / h);
            m_slabs.push_back(s);
            m_open[key] = m_slabs.size() - 1;
            it = m_open.find(key);
        }

        slab& s = m_slabs[it->second];
        const int column = s.count % s.columns;
        const int row = s.count / s.columns;
        ++s.count;

        return glyph_rect{s.block.x + column * s.cell_w, s.block.y + row * s.cell_h, w, h};
    }

    void slab_allocator::reset() {
        m_blocks.reset();
        m_slabs.clear();
        m_open.clear();
    }

    std::vector<glyph_rect> slab_allocator::reserved_regions() const {
        std::vector<glyph_rect> regions;
        regions.reserve(m_slabs.size());
        for (const auto& s : m_slabs) {
            regions.push_back(s.block);
        }
        return regions;
    }

    std::size_t slab_allocator::slab_capacity() const noexcept {
        return static_cast<std::size_t>(width() / m_slab_size) *
               static_cast<std::size_t>(height() / m_slab_size);
    }

    std::string slab_allocator::describe() const {
        std::ostringstream os;
        os << "     Slabs: " << m_slabs.size() << " of " << slab_capacity() << '\n';
        return os.str();
    }

    // =============================================================================
    // Factory
    // =============================================================================
    std::unique_ptr<glyph_allocator> make_glyph_allocator(std::string_view tag, int width, int height) {
        if (tag == "slab") {
            return std::make_unique<slab_allocator>(width, height);
        }
        THROW_IF(tag != "shelf", std::invalid_argument, "Unknown glyph allocator:", std::string(tag));
        return std::make_unique<shelf_allocator>(width, height);
    }
} // namespace glyph_atlas
