/**
 * @file glyph_parser.hh
 * @brief Line parser for Hershey font description data (.jhf).
 *
 * Each line of a .jhf file holds one glyph:
 *
 * | Columns | Content                                              |
 * |---------|------------------------------------------------------|
 * | 0-4     | glyph number (decimal, right aligned)                |
 * | 5-7     | record length in coordinate pairs (not used)         |
 * | 8       | left side bearing                                    |
 * | 9       | right side bearing                                   |
 * | 10-     | coordinate pairs, strokes separated by " R"          |
 *
 * Every bearing and coordinate character is biased by 'R':
 * 'R' is 0, 'T' is +2, 'J' is -8.
 *
 * @code
 *     34  9I[RFJ[ RRFZ[ RMTWT
 *     |   | ||\__/ \__/ \__/
 *     |   | ||  |    |    +-- stroke 3: (-5,2) (5,2)
 *     |   | ||  |    +------- stroke 2: (0,-12) (8,9)
 *     |   | ||  +------------ stroke 1: (0,-12) (-8,9)
 *     |   | |+--------------- right side: +9
 *     |   | +---------------- left side: -9
 *     |   +------------------ length (ignored)
 *     +---------------------- glyph number 34
 * @endcode
 *
 * Lines starting with '#' are JSON directives adjusting the reference
 * lines of the glyphs that follow:
 *
 * @code
 * #{"define_cap_line": -12, "define_base_line": 9}
 * #{"glyph_bottom_line": 20}
 * @endcode
 *
 * `define_*` keys apply to every later glyph of the load, `glyph_*`
 * keys only to the next glyph.
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <hershey_font/hershey_glyph.hh>
#include <cstddef>
#include <string_view>
#include <variant>

namespace hershey_font {
    /// Reference lines a directive returns to unset with a JSON null
    struct HERSHEY_FONT_EXPORT line_resets {
        bool cap_line = false;
        bool base_line = false;
        bool bottom_line = false;
    };

    /**
     * @brief Reference line values a directive line sets.
     *
     * A key whose value is null is reported in the matching resets member
     * instead; it clears whatever the earlier directives set.
     */
    struct HERSHEY_FONT_EXPORT metadata_update {
        line_overrides font_scope;   ///< define_cap_line, define_base_line, define_bottom_line
        line_overrides glyph_scope;  ///< glyph_cap_line, glyph_base_line, glyph_bottom_line
        line_resets font_resets;
        line_resets glyph_resets;
    };

    /**
     * @brief Line that produced neither glyph nor directive.
     *
     * A truncated record (non-blank but shorter than a glyph header) still
     * holds a position in the file, so sequential loading counts it.
     */
    struct HERSHEY_FONT_EXPORT skipped_line {
        bool truncated = false;
    };

    /// Outcome of parsing one line
    using parse_result = std::variant<skipped_line, hershey_glyph, metadata_update>;

    /**
     * @brief Directive state carried from line to line during one load.
     */
    struct HERSHEY_FONT_EXPORT parse_context {
        line_overrides font_scope;     ///< Accumulated define_* values
        line_overrides pending_glyph;  ///< glyph_* values waiting for the next glyph
        std::size_t line_number = 0;   ///< 1-based number of the line being parsed, 0 if unknown
    };

    /// Minimum length of a glyph record (id, length and both bearings)
    inline constexpr std::size_t MIN_GLYPH_LINE = 10;

    /**
     * @brief Decode a single Hershey coordinate character.
     * @return `ch - 'R'`
     */
    [[nodiscard]] constexpr int decode_hershey_value(char ch) {
        return static_cast<int>(static_cast<unsigned char>(ch)) - static_cast<int>('R');
    }

    /**
     * @brief Parse one line of font description data.
     *
     * Directive lines update @p context and are returned as metadata_update.
     * Glyph lines pick up the reference lines currently held in @p context
     * and consume its pending glyph overrides.
     *
     * @param line Raw line, trailing whitespace and line terminators allowed
     * @param context Directive state of the load in progress
     * @return Parsed glyph, applied directive, or skipped_line
     * @throws font_parse_error if a directive is not a JSON object with numeric or null values
     */
    HERSHEY_FONT_EXPORT parse_result parse_line(std::string_view line, parse_context& context);
} // namespace hershey_font
