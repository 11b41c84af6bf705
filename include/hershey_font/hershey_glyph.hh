/**
 * @file hershey_glyph.hh
 * @brief Decoded Hershey glyph: side bearings, strokes and reference lines.
 *
 * A Hershey glyph is a set of pen-down polylines in an integer grid whose
 * origin sits in the middle of the character cell.
 *
 * @section glyph_coord Coordinate System
 *
 * - X increases to the right
 * - Y increases downward
 * - (0, 0) is the center of the glyph cell
 *
 * @code
 *           left_side        right_side
 *               |               |
 *   cap_line  --+-------*-------+--   (-12 for normal size fonts)
 *               |      * *      |
 *               |     *   *     |
 *               |    *******    |
 *               |   *       *   |
 *   base_line --+--*---------*--+--   (9)
 *               |               |
 * bottom_line --+---------------+--   (16, lowest descender)
 * @endcode
 *
 * @section glyph_strokes Strokes
 *
 * Every stroke is an ordered list of absolute points joined by straight
 * lines. A glyph with two strokes is drawn with one pen lift between them
 * (the dot of an 'i', the bar of an 'A').
 *
 * @code{.cpp}
 * for (const auto& stroke : glyph.strokes()) {
 *     for (std::size_t i = 1; i < stroke.size(); ++i) {
 *         draw_line(stroke[i - 1], stroke[i]);
 *     }
 * }
 * @endcode
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <optional>
#include <utility>
#include <vector>

namespace hershey_font {
    namespace internal {
        struct jhf_line_parser;
    }

    /// Hard-coded cap line used when neither glyph nor font defines one
    inline constexpr double DEFAULT_CAP_LINE = -12;
    /// Hard-coded base line used when neither glyph nor font defines one
    inline constexpr double DEFAULT_BASE_LINE = 9;
    /// Hard-coded bottom line used when neither glyph nor font defines one
    inline constexpr double DEFAULT_BOTTOM_LINE = 16;

    /**
     * @brief Point in glyph space.
     */
    struct HERSHEY_FONT_EXPORT glyph_point {
        int x = 0;
        int y = 0;

        bool operator==(const glyph_point&) const = default;
    };

    /// Continuous pen-down polyline
    using glyph_stroke = std::vector<glyph_point>;

    /// Segment between two adjacent points of a stroke
    using glyph_line = std::pair<glyph_point, glyph_point>;

    /**
     * @brief Ink bounding box of a glyph.
     *
     * Both corners are inclusive. A glyph without strokes has
     * both corners at (0, 0).
     */
    struct HERSHEY_FONT_EXPORT glyph_box {
        glyph_point min;  ///< (xmin, ymin)
        glyph_point max;  ///< (xmax, ymax)

        bool operator==(const glyph_box&) const = default;
    };

    /**
     * @brief Typographic box of a glyph.
     *
     * Horizontal extent comes from the side bearings, vertical extent
     * from the cap and bottom lines. It may be larger or smaller than
     * the ink box.
     */
    struct HERSHEY_FONT_EXPORT typographic_box {
        int left = 0;
        double cap_line = DEFAULT_CAP_LINE;
        int right = 0;
        double bottom_line = DEFAULT_BOTTOM_LINE;
    };

    /**
     * @brief Reference line overrides in effect for one glyph.
     *
     * Unset members fall back to the next level: glyph override,
     * then font directive, then the hard-coded defaults.
     */
    struct HERSHEY_FONT_EXPORT line_overrides {
        std::optional<double> cap_line;
        std::optional<double> base_line;
        std::optional<double> bottom_line;

        /// Take every member of @p other that is set
        void merge(const line_overrides& other);

        [[nodiscard]] bool empty() const;
    };

    /**
     * @brief One glyph of a Hershey font.
     *
     * Glyphs are produced by the font loader and are immutable afterwards.
     * A default-constructed glyph is empty: charcode -1, zero bearings,
     * no strokes.
     */
    class HERSHEY_FONT_EXPORT hershey_glyph {
        friend struct internal::jhf_line_parser;

    public:
        hershey_glyph();

        /**
         * @brief Glyph number stored in the font data.
         *
         * This is the Hershey repertory number, not the character the
         * glyph is mapped to. -1 if the record had no numeric id.
         */
        [[nodiscard]] int charcode() const;

        /// Left side bearing
        [[nodiscard]] int left_side() const;

        /// Right side bearing
        [[nodiscard]] int right_side() const;

        /**
         * @brief Horizontal advance in glyph units.
         *
         * `right_side - left_side`. Negative values are kept as is.
         */
        [[nodiscard]] int width() const;

        [[nodiscard]] const std::vector<glyph_stroke>& strokes() const;

        /// Ink bounding box over every point of every stroke
        [[nodiscard]] const glyph_box& draw_box() const;

        /// Side bearings combined with cap and bottom line
        [[nodiscard]] typographic_box char_box() const;

        /**
         * @name Reference lines
         * Effective value after the glyph / font / default fallback.
         * @{
         */
        [[nodiscard]] double cap_line() const;
        [[nodiscard]] double base_line() const;
        [[nodiscard]] double bottom_line() const;
        /** @} */

        /**
         * @brief All line segments of the glyph in untransformed coordinates.
         *
         * A stroke of N points contributes N-1 segments.
         */
        [[nodiscard]] std::vector<glyph_line> lines() const;

    private:
        int m_charcode = -1;
        int m_left_side = 0;
        int m_right_side = 0;
        std::vector<glyph_stroke> m_strokes;
        glyph_box m_draw_box{};
        line_overrides m_lines{};
    };
} // namespace hershey_font
