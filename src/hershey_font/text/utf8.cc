//
// Created by igor on 19/10/2026.
//

#include <hershey_font/text/utf8.hh>

namespace hershey_font {

    namespace {
        constexpr bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }

        // Sequence length announced by a lead byte, 0 if it cannot start one
        constexpr std::size_t sequence_length(unsigned char lead) {
            if (lead < 0x80) return 1;
            if ((lead & 0xE0) == 0xC0) return 2;
            if ((lead & 0xF0) == 0xE0) return 3;
            if ((lead & 0xF8) == 0xF0) return 4;
            return 0;
        }

        // Smallest code point that needs a sequence of the given length
        constexpr char32_t MIN_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
    }

    utf8_char utf8_decode_one(std::string_view str) {
        if (str.empty()) {
            return {};
        }

        const auto* data = reinterpret_cast<const unsigned char*>(str.data());
        const std::size_t len = sequence_length(data[0]);
        if (len == 0) {
            return {REPLACEMENT_CHAR, 1};
        }
        if (len == 1) {
            return {static_cast<char32_t>(data[0]), 1};
        }
        if (str.size() < len) {
            return {REPLACEMENT_CHAR, 1};
        }

        char32_t cp = data[0] & (0x7F >> len);
        for (std::size_t i = 1; i < len; ++i) {
            if (!is_continuation(data[i])) {
                return {REPLACEMENT_CHAR, 1};
            }
            cp = (cp << 6) | (data[i] & 0x3F);
        }

        if (cp < MIN_FOR_LENGTH[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return {REPLACEMENT_CHAR, len};
        }
        return {cp, len};
    }

}  // namespace hershey_font
