/**
 * @file utf8.hh
 * @brief UTF-8 to code point decoding for text composition.
 *
 * Text handed to the compositor is UTF-8. Every decoded code point is
 * looked up in the font on its own; there is no shaping or normalization.
 * Malformed sequences decode to U+FFFD.
 *
 * @code{.cpp}
 * for (char32_t cp : utf8_view("Grüße")) {
 *     // 'G', 'r', U+00FC, U+00DF, 'e'
 * }
 * @endcode
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace hershey_font {
    /// Code point produced for malformed input
    inline constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

    /**
     * @brief One decoded code point and the bytes it occupied.
     *
     * `size` is 0 only for empty input.
     */
    struct HERSHEY_FONT_EXPORT utf8_char {
        char32_t codepoint = REPLACEMENT_CHAR;
        std::size_t size = 0;
    };

    /**
     * @brief Decode the first code point of @p str.
     *
     * Overlong forms, surrogates and values above U+10FFFF are rejected.
     */
    [[nodiscard]] HERSHEY_FONT_EXPORT utf8_char utf8_decode_one(std::string_view str);

    /**
     * @brief Forward range of the code points of a UTF-8 string.
     *
     * The viewed string must outlive the view and its iterators.
     */
    class HERSHEY_FONT_EXPORT utf8_view {
    public:
        class iterator {
        public:
            using value_type = char32_t;
            using difference_type = std::ptrdiff_t;
            using reference = char32_t;
            using iterator_category = std::forward_iterator_tag;

            iterator() = default;
            explicit iterator(std::string_view rest)
                : m_rest(rest), m_char(utf8_decode_one(rest)) {
            }

            char32_t operator*() const { return m_char.codepoint; }

            iterator& operator++() {
                m_rest.remove_prefix(m_char.size);
                m_char = utf8_decode_one(m_rest);
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const iterator& other) const {
                return m_rest.size() == other.m_rest.size();
            }

        private:
            std::string_view m_rest;
            utf8_char m_char{};
        };

        explicit utf8_view(std::string_view str)
            : m_str(str) {
        }

        [[nodiscard]] iterator begin() const { return iterator(m_str); }
        [[nodiscard]] iterator end() const { return iterator(); }

    private:
        std::string_view m_str;
    };
} // namespace hershey_font
