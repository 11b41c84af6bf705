//
// Created by igor on 19/10/2026.
//

#include <hershey_font/hershey_glyph.hh>

namespace hershey_font {

    void line_overrides::merge(const line_overrides& other) {
        if (other.cap_line) {
            cap_line = other.cap_line;
        }
        if (other.base_line) {
            base_line = other.base_line;
        }
        if (other.bottom_line) {
            bottom_line = other.bottom_line;
        }
    }

    bool line_overrides::empty() const {
        return !cap_line && !base_line && !bottom_line;
    }

    hershey_glyph::hershey_glyph() = default;

    int hershey_glyph::charcode() const {
        return m_charcode;
    }

    int hershey_glyph::left_side() const {
        return m_left_side;
    }

    int hershey_glyph::right_side() const {
        return m_right_side;
    }

    int hershey_glyph::width() const {
        return m_right_side - m_left_side;
    }

    const std::vector<glyph_stroke>& hershey_glyph::strokes() const {
        return m_strokes;
    }

    const glyph_box& hershey_glyph::draw_box() const {
        return m_draw_box;
    }

    typographic_box hershey_glyph::char_box() const {
        return {m_left_side, cap_line(), m_right_side, bottom_line()};
    }

    double hershey_glyph::cap_line() const {
        return m_lines.cap_line.value_or(DEFAULT_CAP_LINE);
    }

    double hershey_glyph::base_line() const {
        return m_lines.base_line.value_or(DEFAULT_BASE_LINE);
    }

    double hershey_glyph::bottom_line() const {
        return m_lines.bottom_line.value_or(DEFAULT_BOTTOM_LINE);
    }

    std::vector<glyph_line> hershey_glyph::lines() const {
        std::vector<glyph_line> result;
        for (const auto& stroke : m_strokes) {
            for (std::size_t i = 1; i < stroke.size(); ++i) {
                result.emplace_back(stroke[i - 1], stroke[i]);
            }
        }
        return result;
    }

}  // namespace hershey_font
