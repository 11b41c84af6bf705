/**
 * @file stroke_font.hh
 * @brief Hershey font table: character to glyph mapping and font metrics.
 *
 * A stroke_font owns the glyphs of one loaded Hershey font, keyed by the
 * character they render, together with the render_options used to compose
 * text from them.
 *
 * @section font_codes Character Assignment
 *
 * A .jhf file lists glyphs in ASCII order starting at space, so by default
 * the n-th glyph line of the file renders character `first_code + n`.
 * Fonts that carry real character codes in their glyph number column can be
 * loaded with load_options::use_embedded_code instead.
 *
 * @section font_lines Reference Lines
 *
 * After a load the font-wide cap, base and bottom lines are derived from
 * the glyphs: the most frequent glyph value wins, several equally frequent
 * values are reduced to their median. A `define_*` directive in the data
 * replaces the derived value outright.
 *
 * @section font_usage Usage Example
 *
 * @code{.cpp}
 * stroke_font font;
 * font.load_file("rowmans.jhf");
 * font.normalize(30.0);  // 30 units from bottom line to cap line, Y up
 *
 * for (const auto& [p0, p1] : lines_for_text(font, "Hello")) {
 *     plotter.line(p0.x, p0.y, p1.x, p1.y);
 * }
 * @endcode
 *
 * @note A stroke_font is not synchronized. Loading while another thread
 *       composes text from the same instance is a data race.
 *
 * @see stroke_compositor.hh For turning text into strokes
 * @see font_catalog For loading fonts by name
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <hershey_font/hershey_glyph.hh>
#include <hershey_font/render_options.hh>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hershey_font {
    /**
     * @brief Parameters of stroke_font::load.
     */
    struct HERSHEY_FONT_EXPORT load_options {
        /**
         * @brief Character assigned to the first glyph line.
         *
         * Ignored when use_embedded_code is set.
         */
        char32_t first_code = 32;

        /**
         * @brief Key glyphs by the glyph number stored in the data.
         *
         * Glyph lines without a valid number are not stored in this mode.
         */
        bool use_embedded_code = false;

        /**
         * @brief Keep glyphs already in the font.
         *
         * Newly loaded glyphs replace existing ones with the same character.
         */
        bool merge = false;
    };

    /// Character to glyph mapping
    using glyph_map = std::unordered_map<char32_t, hershey_glyph>;

    /**
     * @brief Loaded Hershey font with its rendering configuration.
     */
    class HERSHEY_FONT_EXPORT stroke_font {
    public:
        /**
         * @brief Construct an empty font.
         *
         * Render options hold their defaults.
         */
        stroke_font();

        /**
         * @name Loading
         * Every load is all-or-nothing: when a directive fails to parse the
         * font keeps its previous glyphs and options.
         * @{
         */

        /**
         * @brief Load glyphs from font description lines.
         *
         * @param lines One glyph record or directive per element
         * @param options Character assignment and merge mode
         * @throws font_parse_error on a malformed directive
         */
        void load(std::span<const std::string_view> lines, const load_options& options = {});

        /// @copydoc load(std::span<const std::string_view>, const load_options&)
        void load(const std::vector<std::string>& lines, const load_options& options = {});

        /// @copydoc load(std::span<const std::string_view>, const load_options&)
        void load(std::initializer_list<std::string_view> lines, const load_options& options = {});

        /**
         * @brief Load glyphs from the full text of a .jhf file.
         *
         * Lines are separated by '\n'; a trailing '\r' is tolerated.
         */
        void load_text(std::string_view text, const load_options& options = {});

        /// Load from raw .jhf bytes
        void load_bytes(std::span<const uint8_t> data, const load_options& options = {});

        /**
         * @brief Load a .jhf file from disk.
         * @throws std::runtime_error if the file cannot be read
         */
        void load_file(const std::filesystem::path& path, const load_options& options = {});

        /// Remove all glyphs and reset the reference lines to their defaults
        void clear();

        /** @} */

        /**
         * @name Glyph Access
         * @{
         */

        /**
         * @brief Get the glyph for a character.
         * @return Pointer to glyph, or nullptr if the font has none
         */
        [[nodiscard]] const hershey_glyph* get_glyph(char32_t ch) const;

        [[nodiscard]] bool has_glyph(char32_t ch) const;

        [[nodiscard]] std::size_t glyph_count() const;

        /// Every glyph of the font
        [[nodiscard]] const glyph_map& glyphs() const;

        /**
         * @brief Glyphs of a UTF-8 string in text order.
         *
         * Characters without a glyph are left out.
         */
        [[nodiscard]] std::vector<const hershey_glyph*> glyphs_for_text(std::string_view text) const;

        /** @} */

        /**
         * @name Rendering Configuration
         * @{
         */

        [[nodiscard]] const render_options& get_render_options() const;

        /**
         * @brief Change render options by name.
         * @throws invalid_config_key on an unknown name, nothing is changed
         */
        void update_render_options(std::initializer_list<option_value> values);

        /// Replace the whole option set
        void set_render_options(const render_options& options);

        /**
         * @brief Scale output to an upright line of the given height.
         *
         * Chooses a uniform scale so the distance from bottom line to cap
         * line becomes @p factor, flips Y so it increases upward and places
         * the bottom line at y = 0. The pen starts at x = 0.
         *
         * @throws std::invalid_argument if bottom line and cap line coincide
         */
        void normalize(double factor = 1.0);

        /** @} */

    private:
        glyph_map m_glyphs;
        render_options m_options{};
    };
} // namespace hershey_font
