#ifndef LANTERN_MARKDOWN_HPP
#define LANTERN_MARKDOWN_HPP

#include <memory_resource>
#include <string_view>

#include "lantern/util/html_writer.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief Renders markdown as HTML.
///
/// The supported subset is:
/// - paragraphs, separated by blank lines,
/// - ATX headings like `## Heading`,
/// - unordered lists with `-` or `*` items and ordered lists with `1.` items,
/// - fenced code blocks with an optional language, which are syntax-highlighted, and
/// - inline code, links like `[text](url)`, `**strong**` and `*emphasized*` text.
///
/// Anything else is rendered as text.
/// Raw HTML is escaped rather than passed through.
void render_markdown(
    HTML_Writer& out,
    std::u8string_view markdown,
    const Syntax_Highlighter& highlighter,
    Logger& logger,
    std::pmr::memory_resource* memory
);

/// @brief Renders markdown which is expected to contain no block-level elements,
/// such as the text of a parameter description.
/// Unlike `render_markdown`, no surrounding `<p>` element is produced.
void render_inline_markdown(HTML_Writer& out, std::u8string_view markdown);

} // namespace lantern

#endif
