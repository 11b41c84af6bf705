//
// Created by igor on 19/10/2026.
//
// Tests for stroke_font loading from .jhf files
//

#include <doctest/doctest.h>
#include <hershey_font/stroke_font.hh>
#include <hershey_font/errors.hh>
#include <cmath>
#include "test_data.hh"

using namespace hershey_font;
using namespace hershey_font::test;

TEST_SUITE("stroke_font") {

    stroke_font load_rowmans() {
        stroke_font font;
        font.load_file(test_data::rowmans());
        return font;
    }

    TEST_CASE("default constructor creates empty font") {
        stroke_font font;

        CHECK(font.glyph_count() == 0);
        CHECK(font.get_glyph(U'A') == nullptr);
        CHECK(font.get_render_options() == render_options{});
    }

    TEST_CASE("rowmans glyphs are assigned from space upward") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        auto font = load_rowmans();

        CHECK(font.glyph_count() == 3);
        CHECK(font.has_glyph(U' '));
        CHECK(font.has_glyph(U'!'));
        CHECK(font.has_glyph(U'"'));
        CHECK_FALSE(font.has_glyph(U'#'));
    }

    TEST_CASE("exclamation mark glyph is decoded") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        auto font = load_rowmans();
        const auto* glyph = font.get_glyph(U'!');
        REQUIRE(glyph != nullptr);

        CHECK(glyph->charcode() == 12345);
        CHECK(glyph->left_side() == -5);
        CHECK(glyph->right_side() == 5);
        CHECK(glyph->width() == 10);

        REQUIRE(glyph->strokes().size() == 2);
        CHECK((glyph->strokes()[0] == glyph_stroke{{0, -12}, {0, 2}}));
        CHECK((glyph->strokes()[1] == glyph_stroke{{0, 7}, {-1, 8}, {0, 9}, {1, 8}, {0, 7}}));

        CHECK((glyph->draw_box() == glyph_box{{-1, -12}, {1, 9}}));
    }

    TEST_CASE("space glyph has width but no strokes") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        auto font = load_rowmans();
        const auto* glyph = font.get_glyph(U' ');
        REQUIRE(glyph != nullptr);

        CHECK(glyph->width() == 16);
        CHECK(glyph->strokes().empty());
        CHECK(glyph->draw_box() == glyph_box{});
    }

    TEST_CASE("fonts without directives use the default reference lines") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        auto font = load_rowmans();
        const auto& opts = font.get_render_options();

        CHECK(opts.cap_line == -12);
        CHECK(opts.base_line == 9);
        CHECK(opts.bottom_line == 16);
    }

    TEST_CASE("embedded codes and directives") {
        REQUIRE(test_data::file_exists(test_data::symbols()));

        stroke_font font;
        load_options options;
        options.use_embedded_code = true;
        font.load_file(test_data::symbols(), options);

        CHECK(font.glyph_count() == 3);
        REQUIRE(font.has_glyph(U'A'));
        REQUIRE(font.has_glyph(U'I'));
        REQUIRE(font.has_glyph(U' '));

        SUBCASE("font directives win over the glyph statistics") {
            const auto& opts = font.get_render_options();
            CHECK(opts.cap_line == -11);
            CHECK(opts.bottom_line == 15);
            // Two glyphs at 9, one at 10
            CHECK(opts.base_line == 9);
        }

        SUBCASE("glyphs see the font directive in effect when parsed") {
            const auto* a = font.get_glyph(U'A');
            CHECK(a->cap_line() == -11);
            CHECK(a->base_line() == 9);
            CHECK(a->bottom_line() == 15);
        }

        SUBCASE("glyph directive applies to the next glyph only") {
            CHECK(font.get_glyph(U'I')->base_line() == 10);
            CHECK(font.get_glyph(U' ')->base_line() == 9);
        }
    }

    TEST_CASE("sequential codes ignore the embedded numbers") {
        REQUIRE(test_data::file_exists(test_data::symbols()));

        stroke_font font;
        font.load_file(test_data::symbols());

        REQUIRE(font.glyph_count() == 3);
        CHECK(font.get_glyph(U' ')->charcode() == 65);
        CHECK(font.get_glyph(U'!')->charcode() == 73);
        CHECK(font.get_glyph(U'"')->charcode() == 32);
    }

    TEST_CASE("merge keeps existing glyphs and overwrites collisions") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));
        REQUIRE(test_data::file_exists(test_data::symbols()));

        auto font = load_rowmans();
        REQUIRE(font.get_glyph(U' ')->charcode() == 12345);

        load_options options;
        options.use_embedded_code = true;
        options.merge = true;
        font.load_file(test_data::symbols(), options);

        CHECK(font.glyph_count() == 5);
        CHECK(font.has_glyph(U'!'));
        CHECK(font.has_glyph(U'A'));
        CHECK(font.get_glyph(U' ')->charcode() == 32);
    }

    TEST_CASE("reload without merge replaces every glyph") {
        REQUIRE(test_data::file_exists(test_data::symbols()));

        auto font = load_rowmans();

        load_options options;
        options.use_embedded_code = true;
        font.load_file(test_data::symbols(), options);

        CHECK(font.glyph_count() == 3);
        CHECK_FALSE(font.has_glyph(U'!'));
    }

    TEST_CASE("malformed directive aborts the load and keeps the font") {
        REQUIRE(test_data::file_exists(test_data::broken()));

        auto font = load_rowmans();
        font.update_render_options({{"spacing", 3.0}});

        CHECK_THROWS_AS(font.load_file(test_data::broken()), font_parse_error);

        CHECK(font.glyph_count() == 3);
        CHECK(font.get_glyph(U'!')->width() == 10);
        CHECK(font.get_render_options().spacing == 3.0);
    }

    TEST_CASE("missing file throws") {
        stroke_font font;
        CHECK_THROWS_AS(font.load_file(test_data::base_path() / "no_such_font.jhf"), std::runtime_error);
    }

    TEST_CASE("normalize maps bottom to cap line onto the requested height") {
        auto font = load_rowmans();
        font.update_render_options({{"xofs", 50.0}});

        font.normalize(30.0);
        const auto& opts = font.get_render_options();

        CHECK(opts.scalex == doctest::Approx(30.0 / 28.0));
        CHECK(opts.scaley == doctest::Approx(-30.0 / 28.0));
        CHECK(opts.xofs == 0.0);
        CHECK(std::abs((opts.bottom_line - opts.cap_line) * opts.scaley) == doctest::Approx(30.0));
        CHECK(opts.bottom_line * opts.scaley + opts.yofs == doctest::Approx(0.0));
    }

    TEST_CASE("normalize rejects a zero height font") {
        stroke_font font;
        font.update_render_options({{"cap_line", 4.0}, {"bottom_line", 4.0}});
        CHECK_THROWS_AS(font.normalize(), std::invalid_argument);
    }

    TEST_CASE("clear empties the font and restores default lines") {
        stroke_font font;
        font.load_file(test_data::symbols());
        REQUIRE(font.get_render_options().cap_line == -11);

        font.clear();

        CHECK(font.glyph_count() == 0);
        CHECK(font.get_render_options().cap_line == -12);
        CHECK(font.get_render_options().bottom_line == 16);
    }
}

TEST_SUITE("stroke_font line statistics") {

    TEST_CASE("statistics come from the glyphs of the current load only") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        stroke_font font;
        font.load_file(test_data::rowmans());
        REQUIRE(font.get_render_options().cap_line == -12);

        load_options options;
        options.use_embedded_code = true;
        options.merge = true;
        font.load({R"(#{"glyph_cap_line": -20})", "   90  1JZ"}, options);

        CHECK(font.glyph_count() == 4);
        CHECK(font.get_render_options().cap_line == -20);
    }

    TEST_CASE("every accepted record counts even when its code is reused") {
        stroke_font font;
        load_options options;
        options.use_embedded_code = true;
        font.load({R"(#{"glyph_cap_line": -20})", "   65  1JZ",
                   R"(#{"glyph_cap_line": -20})", "   65  1JZ",
                   "   66  1JZ"}, options);

        CHECK(font.glyph_count() == 2);
        CHECK(font.get_render_options().cap_line == -20);
    }

    TEST_CASE("equally frequent values reduce to their median") {
        stroke_font font;

        SUBCASE("odd number of modes") {
            font.load({R"(#{"glyph_cap_line": -10})", "    1  1JZ",
                       R"(#{"glyph_cap_line": -20})", "    2  1JZ",
                       R"(#{"glyph_cap_line": -15})", "    3  1JZ"});
            CHECK(font.get_render_options().cap_line == doctest::Approx(-15.0));
        }

        SUBCASE("even number of modes") {
            font.load({R"(#{"glyph_cap_line": -10})", "    1  1JZ",
                       R"(#{"glyph_cap_line": -10})", "    2  1JZ",
                       R"(#{"glyph_cap_line": -15})", "    3  1JZ",
                       R"(#{"glyph_cap_line": -15})", "    4  1JZ"});
            CHECK(font.get_render_options().cap_line == doctest::Approx(-12.5));
        }

        SUBCASE("a single mode wins over the median") {
            font.load({R"(#{"glyph_bottom_line": 20})", "    1  1JZ",
                       R"(#{"glyph_bottom_line": 30})", "    2  1JZ",
                       R"(#{"glyph_bottom_line": 30})", "    3  1JZ",
                       "    4  1JZ"});
            CHECK(font.get_render_options().bottom_line == doctest::Approx(30.0));
        }
    }

    TEST_CASE("null directive value returns the line to the statistics") {
        stroke_font font;
        font.load({R"(#{"define_cap_line": -5})",
                   "    1  1JZ",
                   R"(#{"define_cap_line": null})",
                   "    2  1JZ"});

        CHECK(font.get_glyph(U' ')->cap_line() == -5);
        CHECK(font.get_glyph(U'!')->cap_line() == -12);
        // One glyph at -5 and one at -12: two modes, mean of both
        CHECK(font.get_render_options().cap_line == doctest::Approx(-8.5));
    }
}

TEST_SUITE("stroke_font code assignment") {

    TEST_CASE("truncated record keeps its position in the file") {
        stroke_font font;
        font.load({"    1  1JZ", "short", "    2  5MWRFRT"});

        CHECK(font.glyph_count() == 2);
        CHECK(font.get_glyph(U' ')->charcode() == 1);
        CHECK_FALSE(font.has_glyph(U'!'));
        REQUIRE(font.has_glyph(U'"'));
        CHECK(font.get_glyph(U'"')->charcode() == 2);
    }

    TEST_CASE("blank lines and directives take no code") {
        stroke_font font;
        font.load({"    1  1JZ", "", "   \r", R"(#{"define_base_line": 9})", "    2  5MWRFRT"});

        CHECK(font.glyph_count() == 2);
        REQUIRE(font.has_glyph(U'!'));
        CHECK(font.get_glyph(U'!')->charcode() == 2);
    }

    TEST_CASE("first code moves the whole assignment") {
        stroke_font font;
        load_options options;
        options.first_code = U'a';
        font.load({"    1  1JZ", "    2  5MWRFRT"}, options);

        CHECK(font.get_glyph(U'a')->charcode() == 1);
        CHECK(font.get_glyph(U'b')->charcode() == 2);
        CHECK_FALSE(font.has_glyph(U' '));
    }

    TEST_CASE("glyphs for text follow text order and skip unknown characters") {
        REQUIRE(test_data::file_exists(test_data::rowmans()));

        stroke_font font;
        font.load_file(test_data::rowmans());

        auto glyphs = font.glyphs_for_text("!x\" !");
        REQUIRE(glyphs.size() == 4);
        CHECK(glyphs[0] == font.get_glyph(U'!'));
        CHECK(glyphs[1] == font.get_glyph(U'"'));
        CHECK(glyphs[2] == font.get_glyph(U' '));
        CHECK(glyphs[3] == font.get_glyph(U'!'));

        CHECK(font.glyphs_for_text("").empty());
        CHECK(font.glyphs_for_text("\xC3\xA9").empty());
    }
}
