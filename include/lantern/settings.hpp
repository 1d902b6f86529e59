#ifndef LANTERN_SETTINGS_HPP
#define LANTERN_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define LANTERN_DEBUG 1
#define LANTERN_IF_DEBUG(...) __VA_ARGS__
#define LANTERN_IF_NOT_DEBUG(...)
#else // release builds
#define LANTERN_IF_DEBUG(...)
#define LANTERN_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_EXCEPTIONS
#define LANTERN_EXCEPTIONS ULIGHT_EXCEPTIONS
#endif

#define LANTERN_VERSION_MAJOR 0
#define LANTERN_VERSION_MINOR 3
#define LANTERN_VERSION_PATCH 0

namespace lantern {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = LANTERN_IF_DEBUG(true) LANTERN_IF_NOT_DEBUG(false);

/// @brief The number of tokens that the syntax highlighter buffers
/// before flushing them into the output vector.
inline constexpr std::size_t highlight_token_buffer_size = 256;

/// @brief The maximum Levenshtein distance at which an unknown comment tag
/// is still considered a typo of a known tag.
inline constexpr std::size_t max_tag_typo_distance = 2;

/// @brief Tutorial folders nested less deeply than this are expanded by default
/// in the navigation sidebar.
inline constexpr std::size_t nav_open_depth = 2;

} // namespace lantern

#endif
