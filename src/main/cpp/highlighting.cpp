#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ulight/ulight.hpp"

#include "lantern/util/html_writer.hpp"

#include "lantern/diagnostic.hpp"
#include "lantern/highlighting.hpp"
#include "lantern/services.hpp"

namespace lantern {
namespace {

constexpr std::u8string_view highlighting_tag = u8"h-";
constexpr std::u8string_view highlighting_attribute = u8"data-h";
constexpr auto highlighting_attribute_style = Attribute_Style::double_if_needed;

void log_highlight_failure(
    Logger& logger,
    Syntax_Highlight_Error error,
    std::u8string_view language,
    const Syntax_Highlighter& highlighter,
    std::pmr::memory_resource* memory
)
{
    if (!logger.can_log(Severity::warning)) {
        return;
    }
    std::pmr::u8string message { memory };
    std::u8string_view id;
    switch (error) {
    case Syntax_Highlight_Error::unsupported_language: {
        id = diagnostic::highlight_language;
        message += u8"Unable to highlight code as \"";
        message += language;
        message += u8"\" because the language is not supported.";
        if (const Distant<std::u8string_view> match
            = highlighter.match_supported_language(language, memory);
            match && match.distance <= 2) {
            message += u8" Did you mean \"";
            message += match.value;
            message += u8"\"?";
        }
        break;
    }
    case Syntax_Highlight_Error::bad_code: {
        id = diagnostic::highlight_malformed;
        message += u8"Unable to highlight code because it is malformed.";
        break;
    }
    case Syntax_Highlight_Error::other: {
        id = diagnostic::highlight_error;
        message += u8"Unable to highlight code because of an internal error.";
        break;
    }
    }
    logger.log(Severity::warning, id, message);
}

} // namespace

void write_highlighted_html(
    HTML_Writer& out,
    std::u8string_view code,
    std::span<const Highlight_Span> highlights
)
{
    std::size_t index = 0;
    for (const Highlight_Span& highlight : highlights) {
        LANTERN_ASSERT(highlight.begin + highlight.length <= code.length());
        if (highlight.begin < index) {
            continue;
        }
        // Leading non-highlighted content.
        if (highlight.begin > index) {
            out.write_inner_text(code.substr(index, highlight.begin - index));
        }
        const std::u8string_view id
            = ulight::highlight_type_short_string_u8(ulight::Highlight_Type(highlight.type));
        out.open_tag_with_attributes(highlighting_tag)
            .write_attribute(highlighting_attribute, id, highlighting_attribute_style)
            .end();
        out.write_inner_text(code.substr(highlight.begin, highlight.length));
        out.close_tag(highlighting_tag);
        index = highlight.begin + highlight.length;
    }
    if (index < code.length()) {
        out.write_inner_text(code.substr(index));
    }
}

void write_code(
    HTML_Writer& out,
    std::u8string_view code,
    std::u8string_view language,
    const Syntax_Highlighter& highlighter,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    if (language.empty()) {
        out.write_inner_text(code);
        return;
    }
    std::pmr::vector<Highlight_Span> highlights { memory };
    const Result<void, Syntax_Highlight_Error> result = highlighter(highlights, code, language, memory);
    if (!result) {
        log_highlight_failure(logger, result.error(), language, highlighter, memory);
        out.write_inner_text(code);
        return;
    }
    write_highlighted_html(out, code, highlights);
}

} // namespace lantern
