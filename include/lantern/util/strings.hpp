#ifndef LANTERN_STRINGS_HPP
#define LANTERN_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "lantern/util/chars.hpp"
#include "lantern/util/unicode.hpp"

namespace lantern {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Converts `str` to a `std::string` holding the same code units.
/// This is needed for interfacing with APIs that only accept `char`, like `std::fopen`.
[[nodiscard]]
inline std::string to_char_string(std::u8string_view str)
{
    return std::string { as_string_view(str) };
}

namespace detail {

/// @brief Rudimentary version of `std::ranges::all_of` to avoid including all of `<algorithm>`
template <typename R, typename Predicate>
[[nodiscard]]
constexpr bool all_of(R&& r, Predicate predicate) // NOLINT(cppcoreguidelines-missing-std-forward)
{
    for (const auto& e : r) { // NOLINT(readability-use-anyofallof)
        if (!predicate(e)) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/// @brief Returns `true` if `str` is a possibly empty ASCII string.
[[nodiscard]]
constexpr bool is_ascii(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t x) { return is_ascii(x); };
    return detail::all_of(str, predicate);
}

/// @brief Returns `true` if `str` is a possibly empty ASCII string comprised
/// entirely of blank ASCII characters (`is_ascii_blank`).
[[nodiscard]]
constexpr bool is_ascii_blank(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t x) { return is_ascii_blank(x); };
    return detail::all_of(str, predicate);
}

/// @brief Returns `true` if `str` contains no ASCII uppercase letter.
/// Digits, underscores and non-ASCII code units do not count as uppercase.
[[nodiscard]]
constexpr bool is_ascii_lowercase_only(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t x) { return !is_ascii_upper_alpha(x); };
    return detail::all_of(str, predicate);
}

[[nodiscard]]
constexpr std::size_t length_blank_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::size_t length_blank_right(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[str.length() - i - 1])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    return str.substr(length_blank_left(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_right(std::u8string_view str)
{
    return str.substr(0, str.length() - length_blank_right(str));
}

/// @brief Equivalent to `trim_ascii_blank_right(trim_ascii_blank_left(str))`.
[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank(std::u8string_view str)
{
    return trim_ascii_blank_right(trim_ascii_blank_left(str));
}

/// @brief Removes any leading lines that consist entirely of blank characters,
/// but keeps the indentation of the first non-blank line.
[[nodiscard]]
constexpr std::u8string_view trim_blank_lines_left(std::u8string_view str)
{
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == u8'\n') {
            line_start = i + 1;
        }
        else if (!is_ascii_blank(str[i])) {
            break;
        }
    }
    return is_ascii_blank(str) ? std::u8string_view {} : str.substr(line_start);
}

/// @brief Returns `true` if `str` is a valid HTML tag identifier.
/// This includes both builtin tag names (which are purely alphabetic)
/// and custom tag names.
[[nodiscard]]
constexpr bool is_html_tag_name(std::u8string_view str)
{
    constexpr auto predicate = [](char32_t x) { return is_html_tag_name_character(x); };

    // https://html.spec.whatwg.org/dev/custom-elements.html#valid-custom-element-name
    return !str.empty() //
        && is_ascii_alpha(str[0]) && detail::all_of(utf8::Code_Point_View { str }, predicate);
}

/// @brief Returns `true` if `str` is a valid HTML attribute name.
[[nodiscard]]
constexpr bool is_html_attribute_name(std::u8string_view str)
{
    constexpr auto predicate = [](char32_t x) { return is_html_attribute_name_character(x); };

    // https://html.spec.whatwg.org/dev/syntax.html#syntax-attribute-name
    return !str.empty() //
        && detail::all_of(utf8::Code_Point_View { str }, predicate);
}

/// @brief Returns `true` if the given string requires no wrapping in quotes when it
/// appears as the value in an attribute.
/// For example, `id=123` is a valid HTML attribute with a value and requires
/// no wrapping, but `id="<x>"` requires `<x>` to be surrounded by quotes.
[[nodiscard]]
constexpr bool is_html_unquoted_attribute_value(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t code_unit) {
        return !is_ascii(code_unit) || is_html_ascii_unquoted_attribute_value_character(code_unit);
    };

    // https://html.spec.whatwg.org/dev/syntax.html#unquoted
    return !str.empty() && detail::all_of(str, predicate);
}

} // namespace lantern

#endif
