/**
 * @file render_options.hh
 * @brief Placement, scaling and reference lines used when composing text.
 *
 * The option set is fixed. Options can be read and written as plain struct
 * members or by name; writing by name is validated against the fixed set,
 * so a misspelled option is reported instead of silently ignored.
 *
 * | Name        | Default | Meaning                                      |
 * |-------------|---------|----------------------------------------------|
 * | xofs        | 0       | X of the pen before the first glyph          |
 * | yofs        | 0       | Y added to every transformed point           |
 * | scalex      | 1       | Horizontal scale                             |
 * | scaley      | 1       | Vertical scale (negative flips Y up)         |
 * | spacing     | 0       | Extra advance after each glyph               |
 * | cap_line    | -12     | Font cap line, glyph units                   |
 * | base_line   | 9       | Font base line, glyph units                  |
 * | bottom_line | 16      | Font bottom line, glyph units                |
 *
 * The three line options are computed by the font loader but can be
 * overridden like any other option.
 *
 * @code{.cpp}
 * auto opts = font.get_render_options();
 * font.update_render_options({{"xofs", 100.0}, {"spacing", 2.0}});
 *
 * // Throws invalid_config_key, nothing changes
 * font.update_render_options({{"xofs", 0.0}, {"kerning", 1.0}});
 * @endcode
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <hershey_font/hershey_glyph.hh>
#include <array>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace hershey_font {
    /// Option name and new value
    using option_value = std::pair<std::string_view, double>;

    /**
     * @brief Rendering parameters applied by the stroke compositor.
     */
    struct HERSHEY_FONT_EXPORT render_options {
        double xofs = 0;
        double yofs = 0;
        double scalex = 1;
        double scaley = 1;
        double spacing = 0;
        double cap_line = DEFAULT_CAP_LINE;
        double base_line = DEFAULT_BASE_LINE;
        double bottom_line = DEFAULT_BOTTOM_LINE;

        /// Names of all options in declaration order
        static constexpr std::array<std::string_view, 8> names() {
            return {"xofs", "yofs", "scalex", "scaley", "spacing",
                    "cap_line", "base_line", "bottom_line"};
        }

        /// True if @p name is one of names()
        [[nodiscard]] static bool has_option(std::string_view name);

        /**
         * @brief Read an option by name.
         * @throws invalid_config_key if @p name is not an option
         */
        [[nodiscard]] double get(std::string_view name) const;

        /**
         * @brief Set several options at once.
         *
         * All names are validated before anything is written.
         *
         * @throws invalid_config_key if any name is not an option
         */
        void update(std::initializer_list<option_value> values);

        /**
         * @name Output-space reference lines
         * Line values multiplied by scaley.
         * @{
         */
        [[nodiscard]] double scaled_cap_line() const { return cap_line * scaley; }
        [[nodiscard]] double scaled_base_line() const { return base_line * scaley; }
        [[nodiscard]] double scaled_bottom_line() const { return bottom_line * scaley; }
        /** @} */

        bool operator==(const render_options&) const = default;
    };
} // namespace hershey_font
