//
// Created by igor on 19/10/2026.
//
// Internal font loader declarations
//

#pragma once

#include <hershey_font/glyph_parser.hh>
#include <hershey_font/hershey_glyph.hh>
#include <string_view>

namespace hershey_font::internal {

    /// Build glyphs and directives from .jhf lines
    struct jhf_line_parser {
        static hershey_glyph parse_glyph(std::string_view line, const line_overrides& lines);
        static metadata_update parse_directive(std::string_view json_text, std::size_t line_number);
    };

}  // namespace hershey_font::internal
