#ifndef LANTERN_DIAGNOSTIC_HPP
#define LANTERN_DIAGNOSTIC_HPP

#include <cstddef>
#include <string_view>

#include "lantern/util/severity.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief The location in some input file that is responsible for a diagnostic.
/// An empty `file` means that the diagnostic is not tied to any file.
struct Source_Location {
    std::u8string_view file;
    /// @brief The first byte offset within the file.
    std::size_t begin = 0;
    /// @brief The amount of bytes, possibly zero.
    std::size_t length = 0;

    [[nodiscard]]
    friend constexpr bool operator==(const Source_Location&, const Source_Location&)
        = default;
};

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The location that is responsible for this diagnostic.
    Source_Location location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// COMMENT DIAGNOSTICS =============================================================================

/// @brief In a documentation comment,
/// a tag like `@retrun` was used which is not recognized.
/// The tag and its value are discarded.
inline constexpr std::u8string_view comment_tag_unknown = u8"comment.tag.unknown";
/// @brief In a documentation comment,
/// an attribute like `@example[analyse]` was used which is not recognized.
inline constexpr std::u8string_view comment_attribute_unknown = u8"comment.attribute.unknown";
/// @brief In a `@param` or `@tparam` tag, no parameter name was provided.
inline constexpr std::u8string_view comment_param_missing = u8"comment.param.missing";
/// @brief A tag which requires a value, like `@return`, was given none.
inline constexpr std::u8string_view comment_value_missing = u8"comment.value.missing";
/// @brief A documented symbol has no documentation comment at all.
inline constexpr std::u8string_view comment_missing = u8"comment.missing";

// LINKING DIAGNOSTICS =============================================================================

/// @brief A reference to another symbol could not be resolved,
/// so it is rendered as plain text.
inline constexpr std::u8string_view link_unresolved = u8"link.unresolved";

// HIGHLIGHTING DIAGNOSTICS ========================================================================

/// @brief In syntax highlighting,
/// the given language is not supported.
inline constexpr std::u8string_view highlight_language = u8"highlight.language";
/// @brief In syntax highlighting,
/// the code could not be highlighted because it is malformed.
inline constexpr std::u8string_view highlight_malformed = u8"highlight.malformed";
/// @brief In syntax highlighting,
/// something went wrong.
inline constexpr std::u8string_view highlight_error = u8"highlight.error";

// CONFIGURATION DIAGNOSTICS =======================================================================

/// @brief The configuration contains a key that is not recognized.
inline constexpr std::u8string_view config_key_unknown = u8"config.key.unknown";

// BUILD DIAGNOSTICS ===============================================================================

/// @brief A page was written.
inline constexpr std::u8string_view build_progress = u8"build.progress";
/// @brief A page could not be generated.
inline constexpr std::u8string_view build_page_failed = u8"build.page.failed";
/// @brief The progress callback failed while reporting a built page.
inline constexpr std::u8string_view build_progress_failed = u8"build.progress.failed";

} // namespace diagnostic

} // namespace lantern

#endif
