#ifndef LANTERN_AUTOLINK_HPP
#define LANTERN_AUTOLINK_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/annotation_span.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief A word of narrative text which may be replaced with a link.
/// The `value` is the symbol which claimed the word, or `nullptr`.
using Autolink_Token = Annotation_Span<const Symbol*>;

/// @brief A pending replacement of `length` bytes at `begin` with `value`.
using Replacement = Annotation_Span<std::pmr::u8string>;

/// @brief Splits `text` into maximal runs of identifier characters (`[A-Za-z0-9_]`)
/// and non-ASCII code units.
/// Code spans and blocks delimited by backticks and link destinations like `(url)` in `[x](url)`
/// are not tokenized, since links must not be inserted there.
[[nodiscard]]
std::pmr::vector<Autolink_Token> tokenize_for_autolink(std::u8string_view text, std::pmr::memory_resource* memory);

/// @brief Applies `replacements` to `text`.
/// The replacements are applied in order of their `begin`,
/// which is relative to the original `text`.
/// Replacements shall not overlap.
/// @param replacements The replacements, sorted by `begin`.
[[nodiscard]]
std::pmr::u8string apply_replacements(
    std::u8string_view text,
    std::span<const Replacement> replacements,
    std::pmr::memory_resource* memory
);

/// @brief Rewrites mentions of symbol names in markdown text into links to those symbols.
///
/// Only unqualified names are recognized,
/// and words consisting only of lowercase characters (like `get` or `data`) are never linked.
/// Each name is linked at most once per text, at its first occurrence.
/// If multiple symbols share a name,
/// the first one in a depth-first traversal of the symbol graph is linked.
struct Autolinker {
private:
    const Symbol_Graph& m_graph;
    const Linker& m_linker;

public:
    [[nodiscard]]
    Autolinker(const Symbol_Graph& graph, const Linker& linker) noexcept
        : m_graph { graph }
        , m_linker { linker }
    {
    }

    /// @brief Returns `text` with symbol mentions replaced by markdown links like `[Foo](/class/Foo)`.
    [[nodiscard]]
    std::pmr::u8string operator()(std::u8string_view text, std::pmr::memory_resource* memory) const;
};

} // namespace lantern

#endif
