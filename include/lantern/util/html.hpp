#ifndef LANTERN_HTML_HPP
#define LANTERN_HTML_HPP

#include <concepts>
#include <cstddef>
#include <string_view>

#include "ulight/impl/ascii_algorithm.hpp"

#include "lantern/util/assert.hpp"

namespace lantern {

template <typename F>
concept string_or_char_consumer = requires(F& f, std::u8string_view s, char8_t c) {
    f(s);
    f(c);
};

/// @brief Returns the HTML character reference for one of the characters
/// that have special meaning in HTML, namely `&`, `<`, `>`, `"`, and `'`.
[[nodiscard]]
constexpr std::u8string_view html_entity_of(char8_t c)
{
    switch (c) {
    case u8'&': return u8"&amp;";
    case u8'<': return u8"&lt;";
    case u8'>': return u8"&gt;";
    case u8'"': return u8"&quot;";
    case u8'\'': return u8"&apos;";
    default: break;
    }
    LANTERN_ASSERT_UNREACHABLE(u8"No entity for this character.");
}

template <string_or_char_consumer Out, std::invocable<char8_t> Predicate>
void append_html_escaped(Out& out, std::u8string_view text, Predicate p)
{
    while (!text.empty()) {
        const std::size_t safe_length = ulight::ascii::length_if_not(text, p);
        if (safe_length != 0) {
            out(text.substr(0, safe_length));
            text.remove_prefix(safe_length);
            if (text.empty()) {
                break;
            }
        }
        out(html_entity_of(text.front()));
        text.remove_prefix(1);
    }
}

namespace detail {

struct Charset_Contains_Predicate {
    std::u8string_view charset;

    constexpr bool operator()(char8_t c) const noexcept
    {
        return charset.contains(c);
    }
};

} // namespace detail

/// @brief Appends text to the output where code units in `charset`
/// are replaced with their corresponding HTML entities.
/// For example, if `charset` includes `&`, `&amp;` is appended in its stead.
///
/// `charset` shall be a subset of the entities supported by `html_entity_of`.
template <string_or_char_consumer Out>
void append_html_escaped_of(Out& out, std::u8string_view text, std::u8string_view charset)
{
    append_html_escaped(out, text, detail::Charset_Contains_Predicate { charset });
}

} // namespace lantern

#endif
