//
// Created by igor on 04/01/2026.
//
// Unit tests for static_theme and subscription
//

#include <doctest/doctest.h>
#include <glyph_atlas/theme_source.hh>
#include <memory>
#include <utility>

using namespace glyph_atlas;

TEST_SUITE("theme_source") {

    TEST_CASE("current color table") {
        static_theme theme({{1, 2, 3, 255}, {4, 5, 6, 255}});
        auto colors = theme.current_color_table();
        REQUIRE(colors.size() == 2);
        CHECK(colors[1] == rgba_color{4, 5, 6, 255});
    }

    TEST_CASE("listeners are notified in order") {
        static_theme theme;
        std::vector<int> calls;
        auto a = theme.on_color_theme_change([&calls] { calls.push_back(1); });
        auto b = theme.on_color_theme_change([&calls] { calls.push_back(2); });
        CHECK(calls.empty());  // no call on subscribe
        CHECK(theme.listener_count() == 2);

        theme.set_color_table({{255, 255, 255, 255}});
        CHECK(calls == std::vector<int>{1, 2});
        CHECK(theme.current_color_table().size() == 1);
    }

    TEST_CASE("reset stops notifications") {
        static_theme theme;
        int calls = 0;
        auto sub = theme.on_color_theme_change([&calls] { ++calls; });
        CHECK(sub.active());

        sub.reset();
        CHECK_FALSE(sub.active());
        CHECK(theme.listener_count() == 0);

        theme.set_color_table({});
        CHECK(calls == 0);
    }

    TEST_CASE("subscription is move-only RAII") {
        static_theme theme;
        int calls = 0;
        subscription outer;
        {
            auto inner = theme.on_color_theme_change([&calls] { ++calls; });
            outer = std::move(inner);
            CHECK_FALSE(inner.active());
        }
        theme.set_color_table({});
        CHECK(calls == 1);

        outer = subscription();
        CHECK(theme.listener_count() == 0);
    }

    TEST_CASE("subscription outlives the theme") {
        subscription sub;
        {
            static_theme theme;
            sub = theme.on_color_theme_change([] {});
        }
        CHECK_NOTHROW(sub.reset());
    }

    TEST_CASE("listener unsubscribing another during notification") {
        static_theme theme;
        int second_calls = 0;
        subscription second;
        auto first = theme.on_color_theme_change([&second] { second.reset(); });
        second = theme.on_color_theme_change([&second_calls] { ++second_calls; });

        theme.set_color_table({});
        CHECK(second_calls == 0);
        CHECK(theme.listener_count() == 1);
    }
}
