/**
 * @file errors.hh
 * @brief Exception types raised by the hershey_font library.
 *
 * Every failure the library reports is an exception derived from one of
 * the standard exception classes, so callers can catch either the precise
 * type or its standard base:
 *
 * | Exception            | Base                  | Raised when                        |
 * |----------------------|-----------------------|------------------------------------|
 * | font_parse_error     | std::runtime_error    | a `#` directive is not valid JSON  |
 * | font_not_found       | std::out_of_range     | a catalog lookup misses            |
 * | invalid_config_key   | std::invalid_argument | a render option name is unknown    |
 *
 * Errors raised by an injected archive decoder are never wrapped.
 *
 * @date 19/10/2026
 */

#pragma once

#include <hershey_font/export.h>
#include <stdexcept>
#include <string>

namespace hershey_font {
    /**
     * @brief Malformed metadata directive in font description data.
     *
     * Aborts the load in progress.
     */
    class HERSHEY_FONT_EXPORT font_parse_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Requested font name is not present in a catalog.
     */
    class HERSHEY_FONT_EXPORT font_not_found : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    /**
     * @brief Render option name outside the fixed option set.
     */
    class HERSHEY_FONT_EXPORT invalid_config_key : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };
} // namespace hershey_font
