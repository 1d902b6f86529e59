#ifndef LANTERN_DOC_COMMENT_HPP
#define LANTERN_DOC_COMMENT_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/diagnostic.hpp"
#include "lantern/fwd.hpp"

namespace lantern {

/// @brief A `@param` or `@tparam` entry.
struct Doc_Param {
    std::pmr::u8string name;
    std::pmr::u8string text;
};

/// @brief An `@example` or `@code` block.
struct Doc_Example {
    std::pmr::u8string code;
    /// @brief If `true`, the example is syntax-highlighted as C++ rather than shown verbatim.
    /// This is requested with `@example[analyze]`.
    bool analyze = false;
};

/// @brief The structured contents of a documentation comment.
struct Doc_Comment {
    std::optional<std::pmr::u8string> description;
    std::pmr::vector<Doc_Param> params;
    std::pmr::vector<Doc_Param> tparams;
    std::optional<std::pmr::u8string> returns;
    std::optional<std::pmr::u8string> throws;
    std::pmr::vector<std::pmr::u8string> see;
    std::pmr::vector<std::pmr::u8string> notes;
    std::pmr::vector<std::pmr::u8string> warnings;
    std::optional<std::pmr::u8string> version;
    std::optional<std::pmr::u8string> since;
    std::pmr::vector<Doc_Example> examples;

    [[nodiscard]]
    explicit Doc_Comment(std::pmr::memory_resource* memory)
        : params { memory }
        , tparams { memory }
        , see { memory }
        , notes { memory }
        , warnings { memory }
        , examples { memory }
    {
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return !description && params.empty() && tparams.empty() && !returns && !throws
            && see.empty() && notes.empty() && warnings.empty() && !version && !since
            && examples.empty();
    }
};

/// @brief Removes the comment delimiters from a raw comment,
/// i.e. `/**`, `/*!`, `*/`, and the `///` or `//!` at the start of each line,
/// as well as the `*` which conventionally begins each line of a block comment.
/// Indentation up to that of the first non-empty line is removed from every line,
/// so that further indentation (as in code examples) is preserved.
/// Lines are separated by a single `\n` in the result.
[[nodiscard]]
std::pmr::u8string strip_comment_markers(std::u8string_view raw, std::pmr::memory_resource* memory);

/// @brief Parses the raw text of a documentation comment.
///
/// The comment consists of commands.
/// A command is either an explicit `@tag` optionally followed by attributes like
/// `@example[analyze]`, or text that does not start with `@`,
/// which is an implicit `@description`.
/// The value of a command extends up to the next `@` or the end of the comment.
///
/// Parsing never fails.
/// Unknown tags, unknown attributes, and missing names or values are logged as warnings;
/// unknown tags are discarded and missing names and values are taken to be empty.
/// @param raw The raw comment, possibly including comment delimiters.
/// @param logger Receives the warnings.
/// @param location The location of the commented entity, which is attached to the warnings.
/// @param memory The memory that the result is allocated with.
[[nodiscard]]
Doc_Comment parse_doc_comment(
    std::u8string_view raw,
    Logger& logger,
    Source_Location location,
    std::pmr::memory_resource* memory
);

} // namespace lantern

#endif
