//
// Created by igor on 19/10/2026.
//
// Parser for Hershey font description lines (.jhf format)
//

#include "loaders.hh"
#include <hershey_font/errors.hh>
#include <failsafe/failsafe.hh>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <charconv>
#include <string>

namespace hershey_font {

    namespace {
        // Pen-up marker between two strokes of a glyph
        constexpr std::string_view PEN_UP = " R";

        std::string_view trim_right(std::string_view s) {
            const auto end = s.find_last_not_of(" \t\r\n\f\v");
            return end == std::string_view::npos ? std::string_view{} : s.substr(0, end + 1);
        }

        // Glyph number in columns 0-4, right aligned with leading spaces
        int parse_glyph_number(std::string_view field) {
            const auto first = field.find_first_not_of(' ');
            if (first == std::string_view::npos) {
                return -1;
            }
            field.remove_prefix(first);
            const auto last = field.find_last_not_of(' ');
            field = field.substr(0, last + 1);

            int value = -1;
            auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
            if (ec != std::errc{} || ptr != field.data() + field.size()) {
                return -1;
            }
            return value;
        }

        glyph_stroke decode_stroke(std::string_view segment) {
            glyph_stroke stroke;
            stroke.reserve(segment.size() / 2);
            // An odd trailing character has no partner and is dropped
            for (std::size_t i = 0; i + 1 < segment.size(); i += 2) {
                stroke.push_back({decode_hershey_value(segment[i]),
                                  decode_hershey_value(segment[i + 1])});
            }
            return stroke;
        }

        // Absent keys leave both outputs untouched, null marks the line for reset
        void read_line_value(const nlohmann::json& doc, const char* key, std::size_t line_number,
                             std::optional<double>& value, bool& reset) {
            auto it = doc.find(key);
            if (it == doc.end()) {
                return;
            }
            if (it->is_null()) {
                reset = true;
                return;
            }
            THROW_IF(!it->is_number(), font_parse_error,
                     "Directive value for '", key, "' is not a number (line ", line_number, ")");
            value = it->get<double>();
        }

        void apply_resets(line_overrides& lines, const line_resets& resets) {
            if (resets.cap_line) {
                lines.cap_line.reset();
            }
            if (resets.base_line) {
                lines.base_line.reset();
            }
            if (resets.bottom_line) {
                lines.bottom_line.reset();
            }
        }
    }

    namespace internal {

        hershey_glyph jhf_line_parser::parse_glyph(std::string_view line, const line_overrides& lines) {
            hershey_glyph glyph;
            glyph.m_charcode = parse_glyph_number(line.substr(0, 5));
            glyph.m_left_side = decode_hershey_value(line[8]);
            glyph.m_right_side = decode_hershey_value(line[9]);
            glyph.m_lines = lines;

            std::string_view payload = line.substr(MIN_GLYPH_LINE);
            while (!payload.empty()) {
                const auto sep = payload.find(PEN_UP);
                const auto segment = payload.substr(0, sep);
                if (!segment.empty()) {
                    auto stroke = decode_stroke(segment);
                    if (!stroke.empty()) {
                        glyph.m_strokes.push_back(std::move(stroke));
                    }
                }
                if (sep == std::string_view::npos) {
                    break;
                }
                payload.remove_prefix(sep + PEN_UP.size());
            }

            if (!glyph.m_strokes.empty()) {
                glyph_box box{glyph.m_strokes.front().front(), glyph.m_strokes.front().front()};
                for (const auto& stroke : glyph.m_strokes) {
                    for (const auto& pt : stroke) {
                        box.min.x = std::min(box.min.x, pt.x);
                        box.min.y = std::min(box.min.y, pt.y);
                        box.max.x = std::max(box.max.x, pt.x);
                        box.max.y = std::max(box.max.y, pt.y);
                    }
                }
                glyph.m_draw_box = box;
            }

            return glyph;
        }

        metadata_update jhf_line_parser::parse_directive(std::string_view json_text, std::size_t line_number) {
            nlohmann::json doc;
            try {
                doc = nlohmann::json::parse(json_text.begin(), json_text.end());
            } catch (const nlohmann::json::parse_error& e) {
                throw font_parse_error("Malformed font directive (line " + std::to_string(line_number) +
                                       "): " + e.what());
            }
            THROW_IF(!doc.is_object(), font_parse_error,
                     "Font directive is not a JSON object (line ", line_number, ")");

            metadata_update update;
            read_line_value(doc, "define_cap_line", line_number,
                            update.font_scope.cap_line, update.font_resets.cap_line);
            read_line_value(doc, "define_base_line", line_number,
                            update.font_scope.base_line, update.font_resets.base_line);
            read_line_value(doc, "define_bottom_line", line_number,
                            update.font_scope.bottom_line, update.font_resets.bottom_line);
            read_line_value(doc, "glyph_cap_line", line_number,
                            update.glyph_scope.cap_line, update.glyph_resets.cap_line);
            read_line_value(doc, "glyph_base_line", line_number,
                            update.glyph_scope.base_line, update.glyph_resets.base_line);
            read_line_value(doc, "glyph_bottom_line", line_number,
                            update.glyph_scope.bottom_line, update.glyph_resets.bottom_line);
            return update;
        }

    }  // namespace internal

    parse_result parse_line(std::string_view line, parse_context& context) {
        line = trim_right(line);
        if (line.empty()) {
            return skipped_line{};
        }

        if (line.front() == '#') {
            auto update = internal::jhf_line_parser::parse_directive(line.substr(1), context.line_number);
            apply_resets(context.font_scope, update.font_resets);
            apply_resets(context.pending_glyph, update.glyph_resets);
            context.font_scope.merge(update.font_scope);
            context.pending_glyph.merge(update.glyph_scope);
            LOG_DEBUG("Applied font directive at line ", context.line_number);
            return update;
        }

        if (line.size() < MIN_GLYPH_LINE) {
            return skipped_line{.truncated = true};
        }

        line_overrides lines = context.font_scope;
        lines.merge(context.pending_glyph);
        context.pending_glyph = {};
        return internal::jhf_line_parser::parse_glyph(line, lines);
    }

}  // namespace hershey_font
