#ifndef LANTERN_HTML_WRITER_HPP
#define LANTERN_HTML_WRITER_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include "lantern/util/assert.hpp"
#include "lantern/util/chars.hpp"
#include "lantern/util/html.hpp"
#include "lantern/util/strings.hpp"
#include "lantern/util/url_encode.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

enum struct Attribute_Encoding : Default_Underlying {
    text,
    url,
};

enum struct Attribute_Quoting : bool {
    none,
    quoted,
};

enum struct Attribute_Style : Default_Underlying {
    /// @brief Always use double quotes, like `id="name" class="a b" hidden=""`.
    always_double,
    /// @brief Use double quotes when needed, like `id=name class="a b" hidden`.
    double_if_needed,
};

[[nodiscard]]
constexpr bool attribute_style_demands_quotes(Attribute_Style style)
{
    return style == Attribute_Style::always_double;
}

/// @brief Returns `true` if `c` has to be percent-encoded when it appears in a URL attribute.
/// Percent signs are kept as is,
/// so that URLs which are already percent-encoded are not encoded twice.
[[nodiscard]]
constexpr bool is_url_attribute_encoded(char8_t c) noexcept
{
    return c != u8'%' && is_url_always_encoded(c);
}

template <string_or_char_consumer Out>
struct Basic_Attribute_Writer;

/// @brief A class which provides member functions for writing HTML content to a stream
/// correctly.
/// This writer only performs checks that are possibly without additional memory.
/// These include:
/// - verifying that given tag names and values are appropriate
/// - ensuring that the number of opened tags matches the number of closed tags
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(tag)` or `open_tag_with_attributes(tag)`,
/// there must be a matching `close_tag(tag)`.
template <string_or_char_consumer Out>
struct Basic_HTML_Writer {
public:
    friend Basic_Attribute_Writer<Out>;
    using Self = Basic_HTML_Writer;

private:
    Out m_out;

    std::size_t m_depth = 0;
    bool m_in_attributes = false;

public:
    [[nodiscard]]
    explicit Basic_HTML_Writer(const Out& out)
        : m_out { out }
    {
    }
    [[nodiscard]]
    explicit Basic_HTML_Writer(Out&& out)
        : m_out { std::move(out) }
    {
    }

    Basic_HTML_Writer(const Basic_HTML_Writer&) = delete;
    Basic_HTML_Writer& operator=(const Basic_HTML_Writer&) = delete;

    ~Basic_HTML_Writer() = default;

    /// @brief Returns `true` if all opened tags have been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Writes a self-closing tag such as `<br/>` or `<hr/>`.
    Self& write_self_closing_tag(std::u8string_view id)
    {
        LANTERN_ASSERT(!m_in_attributes);
        LANTERN_ASSERT(is_html_tag_name(id));

        m_out(u8'<');
        m_out(id);
        m_out(u8"/>");

        return *this;
    }

    /// @brief Writes an opening tag such as `<div>`.
    Self& open_tag(std::u8string_view id)
    {
        LANTERN_ASSERT(!m_in_attributes);
        LANTERN_ASSERT(is_html_tag_name(id));

        m_out(u8'<');
        m_out(id);
        m_out(u8'>');
        ++m_depth;

        return *this;
    }

    /// @brief Writes an incomplete opening tag such as `<div`.
    /// Returns an `Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the opening tag.
    [[nodiscard]]
    Basic_Attribute_Writer<Out> open_tag_with_attributes(std::u8string_view id)
    {
        LANTERN_ASSERT(!m_in_attributes);
        LANTERN_ASSERT(is_html_tag_name(id));

        m_out(u8'<');
        m_out(id);

        return Basic_Attribute_Writer<Out> { *this };
    }

    /// @brief Writes a closing tag, such as `</div>`.
    /// The most recent call to `open_tag` or `open_tag_with_attributes` shall have been made with
    /// the same arguments.
    Self& close_tag(std::u8string_view id)
    {
        LANTERN_ASSERT(!m_in_attributes);
        LANTERN_ASSERT(is_html_tag_name(id));
        LANTERN_ASSERT(m_depth != 0);

        --m_depth;

        m_out(u8"</");
        m_out(id);
        m_out(u8'>');

        return *this;
    }

    /// @brief Writes text between tags.
    /// Text characters such as `<` or `>` which interfere with HTML are converted to entities.
    Self& write_inner_text(std::u8string_view text)
    {
        LANTERN_ASSERT(!m_in_attributes);
        append_html_escaped_of(m_out, text, u8"&<>");
        return *this;
    }

    /// @brief Writes HTML content between tags.
    /// Unlike `write_inner_text`, does not escape any entities.
    ///
    /// WARNING: Improper use of this function can easily result in incorrect HTML output.
    Self& write_inner_html(std::u8string_view text)
    {
        LANTERN_ASSERT(!m_in_attributes);
        m_out(text);
        return *this;
    }
    Self& write_inner_html(char8_t c)
    {
        LANTERN_DEBUG_ASSERT(!m_in_attributes);
        LANTERN_DEBUG_ASSERT(is_ascii(c));
        m_out(c);
        return *this;
    }

    /// @brief Convenience function which writes `text` wrapped in an element without attributes,
    /// like `<code>text</code>`.
    Self& write_element(std::u8string_view id, std::u8string_view text)
    {
        open_tag(id);
        write_inner_text(text);
        return close_tag(id);
    }

private:
    Attribute_Quoting write_attribute(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style,
        Attribute_Encoding encoding
    )
    {
        if (value.empty()) {
            return write_empty_attribute(key, style);
        }

        LANTERN_ASSERT(m_in_attributes);
        LANTERN_ASSERT(is_html_attribute_name(key));

        m_out(u8' ');
        m_out(key);
        m_out(u8'=');

        const bool omit_quotes
            = !attribute_style_demands_quotes(style) && is_html_unquoted_attribute_value(value);

        if (omit_quotes) {
            switch (encoding) {
            case Attribute_Encoding::text: {
                m_out(value);
                break;
            }
            case Attribute_Encoding::url: {
                url_encode_ascii_if(m_out, value, is_url_attribute_encoded);
                break;
            }
            }
            return Attribute_Quoting::none;
        }

        m_out(u8'"');
        switch (encoding) {
        case Attribute_Encoding::text: {
            append_html_escaped_of(m_out, value, u8"&\"");
            break;
        }
        case Attribute_Encoding::url: {
            static_assert(is_url_attribute_encoded(u8'"'));
            url_encode_ascii_if(m_out, value, is_url_attribute_encoded);
            break;
        }
        }
        m_out(u8'"');
        return Attribute_Quoting::quoted;
    }

    Attribute_Quoting write_empty_attribute(std::u8string_view key, Attribute_Style style)
    {
        LANTERN_ASSERT(m_in_attributes);
        LANTERN_ASSERT(is_html_attribute_name(key));

        m_out(u8' ');
        m_out(key);

        if (style == Attribute_Style::always_double) {
            m_out(u8"=\"\"");
            return Attribute_Quoting::quoted;
        }
        return Attribute_Quoting::none;
    }

    Self& end_attributes()
    {
        LANTERN_ASSERT(m_in_attributes);

        m_out(u8'>');
        m_in_attributes = false;
        ++m_depth;

        return *this;
    }

    Self& end_empty_tag_attributes()
    {
        LANTERN_ASSERT(m_in_attributes);

        m_out(u8"/>");
        m_in_attributes = false;

        return *this;
    }
};

/// @brief RAII helper class which lets us write attributes more conveniently.
/// This class is not intended to be used directly, but with the help of `HTML_Writer`.
template <string_or_char_consumer Out>
struct Basic_Attribute_Writer {
private:
    Basic_HTML_Writer<Out>& m_writer;
    /// @brief If this is `true`,
    /// it would not be safe to append a `/` character to the written data because it may be
    /// included in the value of an attribute.
    /// For example, this can happen when writing `<img src=xyz`.
    bool m_unsafe_slash = false;

public:
    explicit Basic_Attribute_Writer(Basic_HTML_Writer<Out>& writer)
        : m_writer(writer)
    {
        m_writer.m_in_attributes = true;
    }

    Basic_Attribute_Writer(const Basic_Attribute_Writer&) = delete;
    Basic_Attribute_Writer& operator=(const Basic_Attribute_Writer&) = delete;

    /// @brief Writes an attribute to the stream, such as `class=centered`.
    /// If `value` is empty, writes `key` on its own.
    /// If `value` requires quotes to comply with the HTML standard, quotes are added.
    Basic_Attribute_Writer& write_attribute(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style = Attribute_Style::double_if_needed
    )
    {
        const Attribute_Quoting quoting
            = m_writer.write_attribute(key, value, style, Attribute_Encoding::text);
        m_unsafe_slash = quoting == Attribute_Quoting::none;
        return *this;
    }

    /// @brief Like `write_attribute`,
    /// but applies minimal URL encoding to the value.
    Basic_Attribute_Writer& write_url_attribute(
        std::u8string_view key,
        std::u8string_view value,
        Attribute_Style style = Attribute_Style::double_if_needed
    )
    {
        const Attribute_Quoting quoting
            = m_writer.write_attribute(key, value, style, Attribute_Encoding::url);
        m_unsafe_slash = quoting == Attribute_Quoting::none;
        return *this;
    }

    Basic_Attribute_Writer& write_empty_attribute(
        std::u8string_view key,
        Attribute_Style style = Attribute_Style::double_if_needed
    )
    {
        m_writer.write_empty_attribute(key, style);
        m_unsafe_slash = false;
        return *this;
    }

    Basic_Attribute_Writer&
    write_class(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_attribute(u8"class", value, style);
    }

    Basic_Attribute_Writer&
    write_href(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_url_attribute(u8"href", value, style);
    }

    Basic_Attribute_Writer&
    write_id(std::u8string_view value, Attribute_Style style = Attribute_Style::double_if_needed)
    {
        return write_attribute(u8"id", value, style);
    }

    /// @brief Writes `>` and finishes writing attributes.
    /// This function or `end_empty()` shall be called exactly once prior to destruction of this
    /// writer.
    Basic_Attribute_Writer& end()
    {
        m_writer.end_attributes();
        return *this;
    }

    /// @brief Writes `/>` and finishes writing attributes.
    /// This function or `end()` shall be called exactly once prior to destruction of this
    /// writer.
    Basic_Attribute_Writer& end_empty()
    {
        if (m_unsafe_slash) {
            m_writer.m_out(u8' ');
        }
        m_writer.end_empty_tag_attributes();
        return *this;
    }

    /// @brief Destructor.
    /// A call to `end()` or `end_empty()` shall have been made prior to destruction.
    ~Basic_Attribute_Writer() noexcept(false)
    {
        // This indicates that end() or end_empty() weren't called.
        LANTERN_ASSERT(!m_writer.m_in_attributes);
    }
};

/// @brief Appends everything it receives to a string.
struct String_Consumer {
    std::pmr::u8string& out;

    [[nodiscard]]
    String_Consumer(std::pmr::u8string& out)
        : out { out }
    {
    }

    void operator()(std::u8string_view str) const
    {
        out.append(str);
    }
    void operator()(char8_t c) const
    {
        out.push_back(c);
    }
};

using HTML_Writer = Basic_HTML_Writer<String_Consumer>;
using Attribute_Writer = Basic_Attribute_Writer<String_Consumer>;

} // namespace lantern

#endif
