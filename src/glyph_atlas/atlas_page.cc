//
// Created by igor on 03/01/2026.
//

#include <glyph_atlas/atlas_page.hh>
#include <failsafe/exception.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cstring>
#include <functional>
#include <iomanip>
#include <sstream>

namespace glyph_atlas {

namespace {

// Preview tints
constexpr std::uint8_t WASTE_RGBA[] = {96, 16, 16, 255};
constexpr std::uint8_t CELL_RGBA[] = {16, 72, 16, 255};

void fill_rect(atlas_image& image, const glyph_rect& rect, const std::uint8_t (&rgba)[4]) {
    const int x0 = std::max(rect.x, 0);
    const int y0 = std::max(rect.y, 0);
    const int x1 = std::min(rect.x + rect.w, image.width);
    const int y1 = std::min(rect.y + rect.h, image.height);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            std::memcpy(image.pixels.data() + image.offset(x, y), rgba, 4);
        }
    }
}

double percent(std::size_t part, std::size_t whole) {
    return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

} // anonymous namespace

std::size_t memory_atlas_page::glyph_key_hash::operator()(const glyph_key& key) const noexcept {
    std::size_t h = std::hash<std::string>{}(key.chars);
    h ^= std::hash<std::uint32_t>{}(key.rasterizer_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::uint32_t>{}(key.metadata) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

memory_atlas_page::memory_atlas_page(int index, int size, std::string_view allocator)
    : m_index(index)
    , m_size(size)
    , m_allocator(make_glyph_allocator(allocator, size, size))
    , m_pixels(static_cast<std::size_t>(size) * static_cast<std::size_t>(size), 0) {
}

memory_atlas_page::memory_atlas_page(memory_atlas_page&&) noexcept = default;

memory_atlas_page& memory_atlas_page::operator=(memory_atlas_page&&) noexcept = default;

memory_atlas_page::~memory_atlas_page() = default;

const atlas_glyph& memory_atlas_page::get_glyph(glyph_rasterizer& rasterizer,
                                                std::string_view chars,
                                                std::uint32_t metadata) {
    glyph_key key{rasterizer.id(), std::string(chars), metadata};
    auto it = m_glyphs.find(key);
    if (it != m_glyphs.end()) {
        return it->second;
    }

    rasterized_glyph bitmap = rasterizer.rasterize_glyph(chars, metadata);

    atlas_glyph glyph;
    glyph.page_index = m_index;
    glyph.glyph_index = static_cast<int>(m_glyphs.size());
    glyph.origin_offset_x = bitmap.origin_offset_x;
    glyph.origin_offset_y = bitmap.origin_offset_y;
    glyph.metadata = metadata;

    // Zero-size glyphs (like space) take no room
    if (!bitmap.empty()) {
        // Validate before reserving room, a rejected bitmap must not leak a cell
        THROW_IF(bitmap.pixels.size() < static_cast<std::size_t>(bitmap.width) * static_cast<std::size_t>(bitmap.height),
                 std::invalid_argument, "Rasterized glyph has", bitmap.pixels.size(), "pixels, expected",
                 bitmap.width, "x", bitmap.height);

        auto rect = m_allocator->allocate(bitmap.width, bitmap.height);
        if (!rect) {
            LOG_WARN("Atlas page", m_index, "is full, cannot place", bitmap.width, "x", bitmap.height, "glyph");
            THROW_RUNTIME("atlas page", m_index, "is full");
        }
        write_bitmap(*rect, bitmap);
        glyph.rect = *rect;
        m_used_pixels += static_cast<std::size_t>(rect->w) * static_cast<std::size_t>(rect->h);
    }

    return m_glyphs.emplace(std::move(key), glyph).first->second;
}

bool memory_atlas_page::contains(std::uint32_t rasterizer_id,
                                 std::string_view chars,
                                 std::uint32_t metadata) const {
    return m_glyphs.find(glyph_key{rasterizer_id, std::string(chars), metadata}) != m_glyphs.end();
}

std::uint8_t memory_atlas_page::pixel(int x, int y) const noexcept {
    if (x >= 0 && x < m_size && y >= 0 && y < m_size) {
        return m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_size) +
                        static_cast<std::size_t>(x)];
    }
    return 0;
}

void memory_atlas_page::write_bitmap(const glyph_rect& rect, const rasterized_glyph& bitmap) {
    for (int row = 0; row < rect.h; ++row) {
        std::size_t dst = static_cast<std::size_t>(rect.y + row) * static_cast<std::size_t>(m_size) +
                          static_cast<std::size_t>(rect.x);
        std::size_t src = static_cast<std::size_t>(row) * static_cast<std::size_t>(bitmap.width);
        std::memcpy(m_pixels.data() + dst, bitmap.pixels.data() + src, static_cast<std::size_t>(rect.w));
    }
}

atlas_image memory_atlas_page::usage_preview() const {
    atlas_image image;
    image.width = m_size;
    image.height = m_size;
    image.pixels.assign(static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size) * 4u, 0);
    for (std::size_t i = 3; i < image.pixels.size(); i += 4) {
        image.pixels[i] = 255;
    }

    for (const auto& region : m_allocator->reserved_regions()) {
        fill_rect(image, region, WASTE_RGBA);
    }
    for (const auto& [key, glyph] : m_glyphs) {
        fill_rect(image, glyph.rect, CELL_RGBA);
    }

    // Glyph coverage on top, brightest channel wins
    for (int y = 0; y < m_size; ++y) {
        for (int x = 0; x < m_size; ++x) {
            std::uint8_t alpha = pixel(x, y);
            if (alpha == 0) continue;
            std::uint8_t* px = image.pixels.data() + image.offset(x, y);
            px[0] = std::max(px[0], alpha);
            px[1] = std::max(px[1], alpha);
            px[2] = std::max(px[2], alpha);
        }
    }

    return image;
}

std::string memory_atlas_page::stats() const {
    const std::size_t total = static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size);
    const std::size_t reserved = m_allocator->reserved_pixels();
    const std::size_t wasted = reserved > m_used_pixels ? reserved - m_used_pixels : 0;

    std::ostringstream os;
    os << std::setprecision(2);
    os << "page" << m_index << ":\n";
    os << "     Total: " << total << " (" << m_size << "x" << m_size << ")\n";
    os << "      Used: " << m_used_pixels << " (" << percent(m_used_pixels, total) << "%)\n";
    os << "    Wasted: " << wasted << " (" << percent(wasted, total) << "%)\n";
    os << "Efficiency: " << percent(m_used_pixels, reserved) << "%\n";
    os << "    Glyphs: " << m_glyphs.size() << '\n';
    os << m_allocator->describe();
    return os.str();
}

void memory_atlas_page::clear() {
    m_glyphs.clear();
    m_allocator->reset();
    std::fill(m_pixels.begin(), m_pixels.end(), static_cast<std::uint8_t>(0));
    m_used_pixels = 0;
    LOG_DEBUG("Atlas page", m_index, "cleared");
}

} // namespace glyph_atlas
