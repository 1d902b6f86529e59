#ifndef LANTERN_ASSETS_HPP
#define LANTERN_ASSETS_HPP

#include <string_view>

namespace lantern::assets {

/// @brief Generated from `assets/head.html`.
extern const std::u8string_view head_html;
/// @brief Generated from `assets/main.css`.
extern const std::u8string_view main_css;
/// @brief Generated from `assets/nav.html`.
extern const std::u8string_view nav_html;
/// @brief Generated from `assets/page.html`.
extern const std::u8string_view page_html;

} // namespace lantern::assets

#endif
