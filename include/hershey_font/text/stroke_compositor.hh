/**
 * @file stroke_compositor.hh
 * @brief Compose text into positioned strokes and line segments.
 *
 * The compositor walks a UTF-8 string, looks up each code point in a
 * stroke_font and emits the glyph strokes transformed by the font's
 * render_options:
 *
 * @code
 * x' = pen_x + (x - glyph.left_side()) * scalex
 * y' = yofs  + y * scaley
 * @endcode
 *
 * `pen_x` starts at `xofs` and advances by `spacing + scalex * glyph.width()`
 * after every glyph, including glyphs without strokes. Code points the font
 * has no glyph for are skipped and do not advance the pen.
 *
 * Output is computed from the font's current state on every call; nothing
 * is cached between calls.
 *
 * @section compositor_usage Usage
 *
 * @code{.cpp}
 * // Collect everything
 * auto strokes = strokes_for_text(font, "Hello");
 *
 * // Stream segments straight to a device
 * for_each_line(font, "Hello", [&](const render_point& a, const render_point& b) {
 *     plotter.move_to(a.x, a.y);
 *     plotter.draw_to(b.x, b.y);
 * });
 * @endcode
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <hershey_font/stroke_font.hh>
#include <hershey_font/text/utf8.hh>
#include <concepts>
#include <string_view>
#include <utility>
#include <vector>

namespace hershey_font {
    /**
     * @brief Point in output space.
     */
    struct HERSHEY_FONT_EXPORT render_point {
        double x = 0;
        double y = 0;

        bool operator==(const render_point&) const = default;
    };

    /// Transformed stroke
    using render_stroke = std::vector<render_point>;

    /// Transformed line segment
    using render_line = std::pair<render_point, render_point>;

    /**
     * @brief Callback receiving one transformed stroke.
     *
     * The stroke reference is only valid during the call.
     */
    template<typename F>
    concept stroke_callback = requires(F func, const render_stroke& stroke)
    {
        { func(stroke) } -> std::same_as<void>;
    };

    /**
     * @brief Callback receiving the two end points of one segment.
     */
    template<typename F>
    concept line_callback = requires(F func, const render_point& p0, const render_point& p1)
    {
        { func(p0, p1) } -> std::same_as<void>;
    };

    /**
     * @brief Emit the transformed strokes of @p text in order.
     *
     * @return Total horizontal advance of the text
     */
    template<stroke_callback Fn>
    double for_each_stroke(const stroke_font& font, std::string_view text, Fn&& fn) {
        const auto& opts = font.get_render_options();
        double pen_x = opts.xofs;
        render_stroke out;

        for (char32_t ch : utf8_view(text)) {
            const auto* glyph = font.get_glyph(ch);
            if (!glyph) {
                continue;
            }

            for (const auto& stroke : glyph->strokes()) {
                out.clear();
                for (const auto& pt : stroke) {
                    out.push_back({pen_x + (pt.x - glyph->left_side()) * opts.scalex,
                                   opts.yofs + pt.y * opts.scaley});
                }
                fn(static_cast<const render_stroke&>(out));
            }

            pen_x += opts.spacing + opts.scalex * glyph->width();
        }

        return pen_x - opts.xofs;
    }

    /**
     * @brief Emit every segment between adjacent points of the strokes of @p text.
     *
     * Strokes with fewer than two points emit nothing.
     *
     * @return Total horizontal advance of the text
     */
    template<line_callback Fn>
    double for_each_line(const stroke_font& font, std::string_view text, Fn&& fn) {
        return for_each_stroke(font, text, [&fn](const render_stroke& stroke) {
            for (std::size_t i = 1; i < stroke.size(); ++i) {
                fn(stroke[i - 1], stroke[i]);
            }
        });
    }

    /// All transformed strokes of @p text
    [[nodiscard]] HERSHEY_FONT_EXPORT std::vector<render_stroke> strokes_for_text(const stroke_font& font,
                                                                                 std::string_view text);

    /// All transformed line segments of @p text
    [[nodiscard]] HERSHEY_FONT_EXPORT std::vector<render_line> lines_for_text(const stroke_font& font,
                                                                             std::string_view text);

    /**
     * @brief Horizontal advance of @p text without producing any output.
     *
     * Equals the distance the pen moves while composing the text.
     */
    [[nodiscard]] HERSHEY_FONT_EXPORT double measure_text(const stroke_font& font, std::string_view text);
} // namespace hershey_font
