//
// Created by igor on 05/01/2026.
//
// Unit tests for texture_atlas
//

#include <doctest/doctest.h>
#include <glyph_atlas/texture_atlas.hh>
#include "test_helpers.hh"
#include <limits>

using namespace glyph_atlas;
using namespace glyph_atlas::test;

namespace {
    color_table make_colors(std::size_t n) {
        color_table colors;
        for (std::size_t i = 0; i < n; ++i) {
            colors.push_back({static_cast<std::uint8_t>(i), 0, 0, 255});
        }
        return colors;
    }

    std::vector<std::string> expected_warm_up_order() {
        std::vector<std::string> order;
        for (int code = 65; code <= 90; ++code) order.emplace_back(1, static_cast<char>(code));
        for (int code = 97; code <= 122; ++code) order.emplace_back(1, static_cast<char>(code));
        for (int code = 33; code <= 126; ++code) order.emplace_back(1, static_cast<char>(code));
        return order;
    }
}

TEST_SUITE("texture_atlas") {

    TEST_CASE("page size from pixel ratio") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;

        SUBCASE("ratio 1") {
            fixed_display display(1.0);
            texture_atlas<recording_page> atlas(2048, theme, scheduler, display);
            CHECK(atlas.page_size() == 1024);
            REQUIRE(atlas.pages().size() == 2);
            CHECK(atlas.pages()[0].index() == 0);
            CHECK(atlas.pages()[1].index() == 1);
            CHECK(atlas.pages()[0].size() == 1024);
            CHECK(atlas.pages()[1].size() == 1024);
            CHECK(atlas.pages()[0].allocator() == "slab");
        }

        SUBCASE("ratio 2") {
            fixed_display display(2.0);
            texture_atlas<recording_page> atlas(4096, theme, scheduler, display);
            CHECK(atlas.page_size() == 2048);
        }

        SUBCASE("fractional ratio is floored") {
            fixed_display display(2.7);
            texture_atlas<recording_page> atlas(8192, theme, scheduler, display);
            CHECK(atlas.page_size() == 2048);
        }

        SUBCASE("ratio below 1 counts as 1") {
            fixed_display display(0.5);
            texture_atlas<recording_page> atlas(8192, theme, scheduler, display);
            CHECK(atlas.page_size() == 1024);
        }

        SUBCASE("clamped to hardware maximum") {
            fixed_display display(3.0);
            texture_atlas<recording_page> atlas(2048, theme, scheduler, display);
            CHECK(atlas.page_size() == 2048);

            texture_atlas<recording_page> small(512, theme, scheduler, display);
            CHECK(small.page_size() == 512);
        }

        SUBCASE("custom base size and allocator") {
            fixed_display display(1.0);
            texture_atlas_config config;
            config.base_page_size = 256;
            config.allocator = "shelf";
            texture_atlas<recording_page> atlas(2048, theme, scheduler, display, config);
            CHECK(atlas.page_size() == 256);
            CHECK(atlas.pages()[1].allocator() == "shelf");
            CHECK(atlas.config().allocator == "shelf");
            CHECK(atlas.config().base_page_size == 256);
            CHECK_FALSE(atlas.config().clear_on_theme_change);
        }

        SUBCASE("huge ratio is clamped without overflow") {
            fixed_display display(1e19);
            texture_atlas<recording_page> atlas(4096, theme, scheduler, display);
            CHECK(atlas.page_size() == 4096);
        }

        SUBCASE("infinite ratio is clamped") {
            fixed_display display(std::numeric_limits<double>::infinity());
            texture_atlas<recording_page> atlas(4096, theme, scheduler, display);
            CHECK(atlas.page_size() == 4096);
            CHECK(atlas.pages()[1].size() == 4096);
        }

        SUBCASE("NaN ratio counts as 1") {
            fixed_display display(std::numeric_limits<double>::quiet_NaN());
            texture_atlas<recording_page> atlas(4096, theme, scheduler, display);
            CHECK(atlas.page_size() == 1024);
        }
    }

    TEST_CASE("invalid construction") {
        static_theme theme;
        manual_idle_scheduler scheduler;
        fixed_display display;

        CHECK_THROWS_AS(texture_atlas<recording_page>(0, theme, scheduler, display), std::invalid_argument);

        texture_atlas_config config;
        config.base_page_size = -1;
        CHECK_THROWS_AS(texture_atlas<recording_page>(1024, theme, scheduler, display, config),
                        std::invalid_argument);

        texture_atlas_config bad_allocator;
        bad_allocator.allocator = "buddy";
        CHECK_THROWS_AS(texture_atlas<memory_atlas_page>(1024, theme, scheduler, display, bad_allocator),
                        std::invalid_argument);
        // Failed construction leaves no listener behind
        CHECK(theme.listener_count() == 0);
    }

    TEST_CASE("routing") {
        CHECK(default_page_router("A") == 0);
        CHECK(default_page_router("z") == 0);
        CHECK(default_page_router("1a") == 0);
        CHECK(default_page_router("!") == 1);
        CHECK(default_page_router("42") == 1);
        CHECK(default_page_router("") == 1);
        CHECK(default_page_router("\xC3\xA9") == 1);  // é

        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
        box_rasterizer rasterizer;

        const auto& a = atlas.get_glyph(rasterizer, "A", 0);
        CHECK(a.page_index == 0);
        const auto& bang = atlas.get_glyph(rasterizer, "!", 0);
        CHECK(bang.page_index == 1);

        // Same request, same record
        CHECK(&atlas.get_glyph(rasterizer, "A", 0) == &a);
    }

    TEST_CASE("custom router") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        box_rasterizer rasterizer;

        SUBCASE("everything on page 1") {
            texture_atlas_config config;
            config.router = [](std::string_view) -> std::size_t { return 1; };
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display, config);
            CHECK(atlas.get_glyph(rasterizer, "A", 0).page_index == 1);
        }

        SUBCASE("out of range page") {
            texture_atlas_config config;
            config.router = [](std::string_view) -> std::size_t { return 5; };
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display, config);
            CHECK_THROWS_AS(atlas.get_glyph(rasterizer, "A", 0), std::out_of_range);
        }

        SUBCASE("empty router falls back to default") {
            texture_atlas_config config;
            config.router = nullptr;
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display, config);
            REQUIRE(static_cast<bool>(atlas.config().router));
            CHECK(atlas.get_glyph(rasterizer, "!", 0).page_index == 1);
        }
    }

    TEST_CASE("warm-up is scheduled once per rasterizer") {
        static_theme theme(make_colors(2));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<recording_page> atlas(2048, theme, scheduler, display);
        box_rasterizer r1;

        CHECK_FALSE(atlas.is_warmed_up(r1.id()));
        CHECK(atlas.pending_warm_up_tasks() == 0);

        atlas.get_glyph(r1, "x", 0);
        CHECK(atlas.is_warmed_up(r1.id()));
        CHECK(atlas.pending_warm_up_tasks() == 146);
        CHECK(scheduler.pending_callbacks() == 1);

        atlas.get_glyph(r1, "y", 0);
        atlas.get_glyph(r1, "!", 0);
        CHECK(atlas.pending_warm_up_tasks() == 146);
        CHECK(scheduler.pending_callbacks() == 1);

        // Still warmed after the queue drained
        scheduler.drain();
        CHECK(atlas.pending_warm_up_tasks() == 0);
        atlas.get_glyph(r1, "z", 0);
        CHECK(atlas.pending_warm_up_tasks() == 0);
        CHECK_FALSE(scheduler.has_pending());
    }

    TEST_CASE("warm-up order") {
        recording_page::log().clear();

        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<recording_page> atlas(2048, theme, scheduler, display);
        box_rasterizer rasterizer;

        atlas.get_glyph(rasterizer, "#", 7);
        REQUIRE(recording_page::log().size() == 1);

        scheduler.drain();

        const auto expected = expected_warm_up_order();
        const auto& log = recording_page::log();
        REQUIRE(log.size() == expected.size() + 1);
        for (std::size_t i = 0; i < expected.size(); ++i) {
            const auto& call = log[i + 1];
            CHECK(call.chars == expected[i]);
            CHECK(call.rasterizer_id == rasterizer.id());
            CHECK(call.metadata == encode_foreground(0));
            CHECK(call.page_index == static_cast<int>(default_page_router(call.chars)));
        }
    }

    TEST_CASE("warm-up covers every color") {
        recording_page::log().clear();

        static_theme theme(make_colors(3));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<recording_page> atlas(2048, theme, scheduler, display);
        box_rasterizer rasterizer;

        atlas.get_glyph(rasterizer, "#", 0);
        recording_page::log().clear();

        // One task: 'A' in each color
        scheduler.run_idle_units(1);
        const auto& log = recording_page::log();
        REQUIRE(log.size() == 3);
        for (std::uint32_t i = 0; i < 3; ++i) {
            CHECK(log[i].chars == "A");
            CHECK(log[i].metadata == encode_foreground(i));
            CHECK(decode_foreground(log[i].metadata) == i);
        }
        CHECK(atlas.pending_warm_up_tasks() == 145);
        CHECK(scheduler.has_pending());
    }

    TEST_CASE("new rasterizer supersedes pending warm-up") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
        box_rasterizer ra;
        box_rasterizer rb;

        const atlas_glyph& interactive = atlas.get_glyph(ra, "A", 0);
        scheduler.run_idle_units(5);  // A..E warmed for ra
        CHECK(atlas.pending_warm_up_tasks() == 141);
        const int ra_calls = ra.calls;
        CHECK(ra_calls == 5);  // 'A' was already cached by the interactive call

        atlas.get_glyph(rb, "A", 0);
        CHECK(atlas.pending_warm_up_tasks() == 146);
        scheduler.drain();

        // Nothing more rasterized for ra
        CHECK(ra.calls == ra_calls);
        CHECK(rb.calls > 0);

        // ra's glyphs survive
        const auto& page0 = atlas.pages()[0];
        CHECK(page0.contains(ra.id(), "A", 0));
        CHECK(page0.contains(ra.id(), "E", encode_foreground(0)));
        CHECK_FALSE(page0.contains(ra.id(), "F", encode_foreground(0)));
        CHECK(&atlas.get_glyph(ra, "A", 0) == &interactive);
        CHECK(ra.calls == ra_calls);
    }

    TEST_CASE("color table replaced on theme change") {
        static_theme theme(make_colors(2));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<recording_page> atlas(2048, theme, scheduler, display);

        auto before = atlas.colors();
        REQUIRE(before);
        CHECK(before->size() == 2);

        theme.set_color_table(make_colors(5));
        auto after = atlas.colors();
        CHECK(after->size() == 5);
        CHECK(after != before);
        // Old table untouched
        CHECK(before->size() == 2);
    }

    TEST_CASE("theme change during a warm-up task") {
        recording_page::log().clear();

        static_theme theme(make_colors(2));
        manual_idle_scheduler scheduler;
        fixed_display display;

        // Swap the theme from inside the first warm-up lookup
        bool armed = false;
        bool swapped = false;
        texture_atlas_config config;
        config.router = [&](std::string_view chars) -> std::size_t {
            if (armed && !swapped) {
                swapped = true;
                theme.set_color_table(make_colors(5));
            }
            return default_page_router(chars);
        };
        texture_atlas<recording_page> atlas(2048, theme, scheduler, display, config);
        box_rasterizer rasterizer;

        atlas.get_glyph(rasterizer, "#", 0);
        recording_page::log().clear();
        armed = true;

        scheduler.run_idle_units(1);

        // The task started with the 2-color table and kept it
        CHECK(swapped);
        CHECK(recording_page::log().size() == 2);
        CHECK(atlas.colors()->size() == 5);

        // The next task sees the new table in full
        recording_page::log().clear();
        scheduler.run_idle_units(1);
        CHECK(recording_page::log().size() == 5);
    }

    TEST_CASE("clear on theme change") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        box_rasterizer rasterizer;

        SUBCASE("default keeps glyphs") {
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
            atlas.get_glyph(rasterizer, "A", 0);
            theme.set_color_table(make_colors(4));
            CHECK(atlas.pages()[0].glyph_count() == 1);
        }

        SUBCASE("enabled clears every page") {
            texture_atlas_config config;
            config.clear_on_theme_change = true;
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display, config);
            atlas.get_glyph(rasterizer, "A", 0);
            atlas.get_glyph(rasterizer, "!", 0);
            CHECK(atlas.pages()[0].glyph_count() == 1);
            CHECK(atlas.pages()[1].glyph_count() == 1);

            theme.set_color_table(make_colors(4));
            CHECK(atlas.pages()[0].glyph_count() == 0);
            CHECK(atlas.pages()[1].glyph_count() == 0);
            CHECK(atlas.colors()->size() == 4);
        }
    }

    TEST_CASE("diagnostics follow page order") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
        box_rasterizer rasterizer;
        atlas.get_glyph(rasterizer, "A", 0);

        auto stats = atlas.stats();
        REQUIRE(stats.size() == atlas.pages().size());
        CHECK(stats[0].rfind("page0:", 0) == 0);
        CHECK(stats[1].rfind("page1:", 0) == 0);

        auto previews = atlas.usage_previews();
        REQUIRE(previews.size() == atlas.pages().size());
        for (const auto& preview : previews) {
            CHECK(preview.width == atlas.page_size());
            CHECK(preview.height == atlas.page_size());
            CHECK(preview.pixels.size() ==
                  static_cast<std::size_t>(atlas.page_size()) * static_cast<std::size_t>(atlas.page_size()) * 4u);
        }
    }

    TEST_CASE("page errors propagate") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        texture_atlas_config config;
        config.base_page_size = 64;
        config.allocator = "shelf";
        texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display, config);
        box_rasterizer big(40, 40);

        CHECK(atlas.page_size() == 64);
        CHECK_NOTHROW(atlas.get_glyph(big, "A", 0));
        CHECK_THROWS_AS(atlas.get_glyph(big, "B", 0), std::runtime_error);

        // Warm-up hits the same wall but never throws to the host
        CHECK_NOTHROW(scheduler.drain());
        CHECK(atlas.pending_warm_up_tasks() == 0);
    }

    TEST_CASE("dispose") {
        static_theme theme(make_colors(1));
        manual_idle_scheduler scheduler;
        fixed_display display;
        box_rasterizer rasterizer;

        {
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
            atlas.get_glyph(rasterizer, "A", 0);
            CHECK(theme.listener_count() == 1);
            CHECK(scheduler.has_pending());

            atlas.dispose();
            CHECK(atlas.pages().empty());
            CHECK(atlas.pending_warm_up_tasks() == 0);
            CHECK_FALSE(scheduler.has_pending());
            CHECK(theme.listener_count() == 0);
            CHECK_THROWS_AS(atlas.get_glyph(rasterizer, "A", 0), std::logic_error);

            atlas.dispose();  // idempotent
        }

        {
            texture_atlas<memory_atlas_page> atlas(2048, theme, scheduler, display);
            atlas.get_glyph(rasterizer, "A", 0);
        }
        // Destructor released the queue and the subscription
        CHECK_FALSE(scheduler.has_pending());
        CHECK(theme.listener_count() == 0);
    }
}
