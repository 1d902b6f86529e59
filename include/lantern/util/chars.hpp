#ifndef LANTERN_CHARS_HPP
#define LANTERN_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace lantern {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::is_html_ascii_unquoted_attribute_value_character;
using ulight::is_html_attribute_name_character;
using ulight::is_html_tag_name_character;
using ulight::is_html_whitespace;
using ulight::is_scalar_value;
using ulight::to_ascii_lower;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs,
/// unlike `is_ascii_whitespace`.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

/// @brief Returns true if `c` is a blank character other than a line break.
[[nodiscard]]
constexpr bool is_ascii_inline_blank(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\v' || c == u8'\f';
}

/// @brief Returns true if `c` can be part of a C++ identifier,
/// restricted to the basic character set.
[[nodiscard]]
constexpr bool is_cpp_ascii_identifier_character(char8_t c)
{
    return is_ascii_alphanumeric(c) || c == u8'_';
}

} // namespace lantern

#endif
