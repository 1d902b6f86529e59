#ifndef LANTERN_DOC_HTML_HPP
#define LANTERN_DOC_HTML_HPP

#include <memory_resource>
#include <string_view>

#include "lantern/util/html_writer.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief The services needed to render documentation text.
struct Doc_HTML_Context {
    /// @brief Links mentions of symbols in descriptions.
    const Autolinker& autolinker;
    /// @brief Highlights code blocks and `@example[analyze]` blocks.
    const Syntax_Highlighter& highlighter;
    Logger& logger;
    std::pmr::memory_resource* memory;
};

/// @brief Autolinks the markdown `text` and renders it as block content.
void write_doc_text_html(HTML_Writer& out, std::u8string_view text, const Doc_HTML_Context& context);

/// @brief Like `write_doc_text_html`, but renders `text` as inline content.
void write_doc_inline_html(
    HTML_Writer& out,
    std::u8string_view text,
    const Doc_HTML_Context& context
);

/// @brief Writes the contents of a documentation comment as a `<div class=description>`,
/// consisting of the version tags, the description, and sections for the parameters,
/// template parameters, return value, exceptions, references, notes, warnings and examples.
/// An empty comment is rendered as a placeholder paragraph.
void write_doc_comment_html(
    HTML_Writer& out,
    const Doc_Comment& comment,
    const Doc_HTML_Context& context
);

} // namespace lantern

#endif
