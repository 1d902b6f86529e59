#ifndef LANTERN_HIGHLIGHTING_HPP
#define LANTERN_HIGHLIGHTING_HPP

#include <memory_resource>
#include <span>
#include <string_view>

#include "lantern/util/html_writer.hpp"

#include "lantern/diagnostic.hpp"
#include "lantern/fwd.hpp"
#include "lantern/services.hpp"

namespace lantern {

/// @brief Writes `code` with `<h- data-h=...>` elements around the given `highlights`.
/// The highlights shall be sorted and not overlap.
void write_highlighted_html(
    HTML_Writer& out,
    std::u8string_view code,
    std::span<const Highlight_Span> highlights
);

/// @brief Highlights `code` as `language` and writes the result.
/// If highlighting fails, a warning is logged and `code` is written as plain text.
void write_code(
    HTML_Writer& out,
    std::u8string_view code,
    std::u8string_view language,
    const Syntax_Highlighter& highlighter,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace lantern

#endif
