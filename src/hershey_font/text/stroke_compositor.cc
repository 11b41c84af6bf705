//
// Created by igor on 19/10/2026.
//

#include <hershey_font/text/stroke_compositor.hh>

namespace hershey_font {

    std::vector<render_stroke> strokes_for_text(const stroke_font& font, std::string_view text) {
        std::vector<render_stroke> result;
        for_each_stroke(font, text, [&result](const render_stroke& stroke) {
            result.push_back(stroke);
        });
        return result;
    }

    std::vector<render_line> lines_for_text(const stroke_font& font, std::string_view text) {
        std::vector<render_line> result;
        for_each_line(font, text, [&result](const render_point& p0, const render_point& p1) {
            result.emplace_back(p0, p1);
        });
        return result;
    }

    double measure_text(const stroke_font& font, std::string_view text) {
        double advance = 0;
        for (const auto* glyph : font.glyphs_for_text(text)) {
            advance += font.get_render_options().spacing +
                       font.get_render_options().scalex * glyph->width();
        }
        return advance;
    }

}  // namespace hershey_font
