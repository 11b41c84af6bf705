//
// Created by igor on 19/10/2026.
//
// Unit tests for hershey_glyph and reference line overrides
//

#include <doctest/doctest.h>
#include <hershey_font/hershey_glyph.hh>
#include <hershey_font/glyph_parser.hh>

using namespace hershey_font;

TEST_SUITE("hershey_glyph") {

    TEST_CASE("default glyph is empty") {
        hershey_glyph glyph;

        CHECK(glyph.charcode() == -1);
        CHECK(glyph.width() == 0);
        CHECK(glyph.strokes().empty());
        CHECK(glyph.lines().empty());
        CHECK(glyph.cap_line() == DEFAULT_CAP_LINE);
        CHECK(glyph.base_line() == DEFAULT_BASE_LINE);
        CHECK(glyph.bottom_line() == DEFAULT_BOTTOM_LINE);
    }

    TEST_CASE("lines connect adjacent points of each stroke") {
        parse_context context;
        auto glyph = std::get<hershey_glyph>(parse_line("  501  9I[RFJ[ RRFZ[ RMTWT", context));

        auto lines = glyph.lines();
        REQUIRE(lines.size() == 3);
        CHECK((lines[0] == glyph_line{{0, -12}, {-8, 9}}));
        CHECK((lines[2] == glyph_line{{-5, 2}, {5, 2}}));
    }

    TEST_CASE("lines of a polyline stroke") {
        parse_context context;
        auto glyph = std::get<hershey_glyph>(parse_line("12345  9MWRYQZR[SZRY", context));

        auto lines = glyph.lines();
        REQUIRE(lines.size() == 4);
        CHECK((lines[0] == glyph_line{{0, 7}, {-1, 8}}));
        CHECK((lines[3] == glyph_line{{1, 8}, {0, 7}}));
    }

    TEST_CASE("single point stroke has no lines") {
        parse_context context;
        auto glyph = std::get<hershey_glyph>(parse_line("    7  2JZRR", context));

        REQUIRE(glyph.strokes().size() == 1);
        CHECK(glyph.strokes()[0].size() == 1);
        CHECK(glyph.lines().empty());
        CHECK((glyph.draw_box() == glyph_box{{0, 0}, {0, 0}}));
    }
}

TEST_SUITE("line_overrides") {

    TEST_CASE("empty until a line is set") {
        line_overrides overrides;
        CHECK(overrides.empty());

        overrides.bottom_line = 14.0;
        CHECK_FALSE(overrides.empty());
    }

    TEST_CASE("merge replaces only the lines the other side sets") {
        line_overrides target;
        target.cap_line = -10.0;
        target.base_line = 8.0;

        line_overrides update;
        update.base_line = 7.5;
        update.bottom_line = 13.0;

        target.merge(update);

        CHECK(target.cap_line == -10.0);
        CHECK(target.base_line == 7.5);
        CHECK(target.bottom_line == 13.0);
    }

    TEST_CASE("merging nothing changes nothing") {
        line_overrides target;
        target.cap_line = -10.0;
        target.merge(line_overrides{});

        CHECK(target.cap_line == -10.0);
        CHECK_FALSE(target.base_line.has_value());
    }
}
