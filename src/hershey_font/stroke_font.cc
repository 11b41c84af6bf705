//
// Created by igor on 19/10/2026.
//

#include <hershey_font/stroke_font.hh>
#include <hershey_font/glyph_parser.hh>
#include <hershey_font/text/utf8.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <map>

#include "utils/file_io.hh"

namespace hershey_font {

    namespace {
        // Most frequent value; several equally frequent values reduce to their median
        double mode_median(const std::vector<double>& values) {
            std::map<double, std::size_t> counts;
            std::size_t best = 0;
            for (double v : values) {
                best = std::max(best, ++counts[v]);
            }

            std::vector<double> modes;  // ascending, std::map keeps keys ordered
            for (const auto& [value, count] : counts) {
                if (count == best) {
                    modes.push_back(value);
                }
            }

            const std::size_t n = modes.size();
            if (n % 2 == 1) {
                return modes[n / 2];
            }
            return (modes[n / 2 - 1] + modes[n / 2]) / 2.0;
        }

        // Reference line samples of every glyph accepted by one load
        struct line_samples {
            std::vector<double> cap;
            std::vector<double> base;
            std::vector<double> bottom;

            void add(const hershey_glyph& glyph) {
                cap.push_back(glyph.cap_line());
                base.push_back(glyph.base_line());
                bottom.push_back(glyph.bottom_line());
            }
        };

        double font_line(const std::vector<double>& samples, const std::optional<double>& defined,
                         double fallback) {
            if (defined) {
                return *defined;
            }
            if (samples.empty()) {
                return fallback;
            }
            return mode_median(samples);
        }
    }

    stroke_font::stroke_font() = default;

    void stroke_font::load(std::span<const std::string_view> lines, const load_options& options) {
        glyph_map glyphs;
        if (options.merge) {
            glyphs = m_glyphs;
        }

        parse_context context;
        line_samples samples;
        char32_t next_code = options.first_code;
        std::size_t loaded = 0;

        for (std::size_t i = 0; i < lines.size(); ++i) {
            context.line_number = i + 1;
            auto result = parse_line(lines[i], context);

            if (const auto* skipped = std::get_if<skipped_line>(&result)) {
                if (skipped->truncated && !options.use_embedded_code) {
                    LOG_DEBUG("Truncated glyph record at line ", context.line_number,
                              " takes code ", static_cast<uint32_t>(next_code));
                    ++next_code;
                }
                continue;
            }

            auto* glyph = std::get_if<hershey_glyph>(&result);
            if (!glyph) {
                continue;
            }

            char32_t key = next_code;
            if (options.use_embedded_code) {
                if (glyph->charcode() < 0) {
                    LOG_DEBUG("Glyph without number at line ", context.line_number, " not stored");
                    continue;
                }
                key = static_cast<char32_t>(glyph->charcode());
            }
            samples.add(*glyph);
            glyphs.insert_or_assign(key, std::move(*glyph));
            ++next_code;
            ++loaded;
        }

        render_options opts = m_options;
        opts.cap_line = font_line(samples.cap, context.font_scope.cap_line, DEFAULT_CAP_LINE);
        opts.base_line = font_line(samples.base, context.font_scope.base_line, DEFAULT_BASE_LINE);
        opts.bottom_line = font_line(samples.bottom, context.font_scope.bottom_line, DEFAULT_BOTTOM_LINE);

        m_glyphs = std::move(glyphs);
        m_options = opts;

        LOG_DEBUG("Loaded ", loaded, " glyphs, font has ", m_glyphs.size(),
                  " (cap ", m_options.cap_line, ", base ", m_options.base_line,
                  ", bottom ", m_options.bottom_line, ")");
    }

    void stroke_font::load(const std::vector<std::string>& lines, const load_options& options) {
        std::vector<std::string_view> views(lines.begin(), lines.end());
        load(std::span<const std::string_view>(views), options);
    }

    void stroke_font::load(std::initializer_list<std::string_view> lines, const load_options& options) {
        load(std::span<const std::string_view>(lines.begin(), lines.size()), options);
    }

    void stroke_font::load_text(std::string_view text, const load_options& options) {
        auto lines = internal::split_lines(text);
        load(std::span<const std::string_view>(lines), options);
    }

    void stroke_font::load_bytes(std::span<const uint8_t> data, const load_options& options) {
        load_text(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()), options);
    }

    void stroke_font::load_file(const std::filesystem::path& path, const load_options& options) {
        auto data = internal::read_file(path);
        load_bytes(data, options);
        LOG_INFO("Loaded Hershey font ", path.string());
    }

    void stroke_font::clear() {
        load(std::span<const std::string_view>{}, load_options{});
    }

    const hershey_glyph* stroke_font::get_glyph(char32_t ch) const {
        auto it = m_glyphs.find(ch);
        if (it == m_glyphs.end()) {
            return nullptr;
        }
        return &it->second;
    }

    bool stroke_font::has_glyph(char32_t ch) const {
        return m_glyphs.contains(ch);
    }

    std::size_t stroke_font::glyph_count() const {
        return m_glyphs.size();
    }

    const glyph_map& stroke_font::glyphs() const {
        return m_glyphs;
    }

    std::vector<const hershey_glyph*> stroke_font::glyphs_for_text(std::string_view text) const {
        std::vector<const hershey_glyph*> result;
        for (char32_t ch : utf8_view(text)) {
            if (const auto* glyph = get_glyph(ch)) {
                result.push_back(glyph);
            }
        }
        return result;
    }

    const render_options& stroke_font::get_render_options() const {
        return m_options;
    }

    void stroke_font::update_render_options(std::initializer_list<option_value> values) {
        m_options.update(values);
    }

    void stroke_font::set_render_options(const render_options& options) {
        m_options = options;
    }

    void stroke_font::normalize(double factor) {
        const double height = m_options.bottom_line - m_options.cap_line;
        THROW_IF(height == 0.0, std::invalid_argument,
                 "Cannot normalize font: bottom line equals cap line (", m_options.cap_line, ")");

        const double scale = factor / height;
        m_options.scalex = scale;
        m_options.scaley = -scale;
        m_options.yofs = m_options.bottom_line * scale;
        m_options.xofs = 0;
    }

}  // namespace hershey_font
