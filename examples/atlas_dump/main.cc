//
// Atlas dump
// Warms a texture atlas up with a TrueType font and writes every page
// usage preview as a PPM image
//

#include <glyph_atlas/texture_atlas.hh>
#include <glyph_atlas/atlas_page.hh>
#include <glyph_atlas/stb_truetype_rasterizer.hh>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace glyph_atlas;

// ============================================================================
// Configuration
// ============================================================================

constexpr float DEFAULT_FONT_SIZE = 16.0f;
constexpr int MAX_TEXTURE_SIZE = 4096;
constexpr auto FRAME_IDLE_BUDGET = std::chrono::milliseconds(2);

// Dark+ token colors
const char* THEME_COLORS[] = {
    "#d4d4d4", "#569cd6", "#ce9178", "#6a9955", "#dcdcaa", "#4ec9b0", "#c586c0", "#9cdcfe",
};

// ============================================================================
// Utility functions
// ============================================================================

std::vector<uint8_t> load_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

bool write_ppm(const std::string& path, const atlas_image& image) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out << "P6\n" << image.width << ' ' << image.height << "\n255\n";
    for (std::size_t i = 0; i + 3 < image.pixels.size(); i += 4) {
        out.put(static_cast<char>(image.pixels[i]));
        out.put(static_cast<char>(image.pixels[i + 1]));
        out.put(static_cast<char>(image.pixels[i + 2]));
    }
    return static_cast<bool>(out);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <font_file> [pixel_height] [pixel_ratio] [output_prefix]\n";
        return 1;
    }

    const std::string font_path = argv[1];
    const float font_size = (argc > 2) ? std::strtof(argv[2], nullptr) : DEFAULT_FONT_SIZE;
    const double pixel_ratio = (argc > 3) ? std::strtod(argv[3], nullptr) : 1.0;
    const std::string prefix = (argc > 4) ? argv[4] : "atlas";

    auto data = load_file(font_path);
    if (data.empty()) {
        std::cerr << "Failed to load font file: " << font_path << '\n';
        return 1;
    }

    try {
        color_table colors;
        for (const char* hex : THEME_COLORS) {
            colors.push_back(parse_hex_color(hex));
        }

        static_theme theme(colors);
        manual_idle_scheduler scheduler;
        fixed_display display(pixel_ratio);
        stb_truetype_rasterizer rasterizer(data, font_size);

        texture_atlas<memory_atlas_page> atlas(MAX_TEXTURE_SIZE, theme, scheduler, display);

        // First request schedules the warm-up
        atlas.get_glyph(rasterizer, "Hello", encode_foreground(0));
        std::cout << "Warm-up tasks: " << atlas.pending_warm_up_tasks() << '\n';

        // Pump the scheduler the way a render loop would, one slice per frame
        int frames = 0;
        while (scheduler.has_pending()) {
            scheduler.run_idle(FRAME_IDLE_BUDGET);
            ++frames;
        }
        std::cout << "Drained in " << frames << " idle slices\n\n";

        for (const auto& stats : atlas.stats()) {
            std::cout << stats << '\n';
        }

        auto previews = atlas.usage_previews();
        for (std::size_t i = 0; i < previews.size(); ++i) {
            const std::string path = prefix + "_page" + std::to_string(i) + ".ppm";
            if (!write_ppm(path, previews[i])) {
                std::cerr << "Failed to write " << path << '\n';
                return 1;
            }
            std::cout << "Wrote " << path << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
