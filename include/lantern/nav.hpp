#ifndef LANTERN_NAV_HPP
#define LANTERN_NAV_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "lantern/util/html_writer.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief A link to a section within a page, such as a member function of a class.
struct Nav_Anchor {
    std::u8string title;
    std::u8string href;
};

/// @brief A link to a page.
struct Nav_Link {
    std::u8string name;
    std::u8string href;
    std::vector<Nav_Anchor> anchors;
};

/// @brief A collapsible group of items.
struct Nav_Dir {
    std::u8string name;
    std::vector<Nav_Item> items;
    /// @brief If `true`, the group is expanded by default.
    bool open = false;
};

/// @brief One of the top-level sections of the navigation,
/// like the namespaces or the files.
/// A root without a name is a plain list of its items.
struct Nav_Root {
    std::optional<std::u8string> name;
    std::vector<Nav_Item> items;
};

/// @brief The contribution of an entry to the navigation sidebar.
struct Nav_Item {
    std::variant<Nav_Link, Nav_Dir, Nav_Root> value;
};

/// @brief Writes `item` and everything nested in it as HTML.
/// Directories and named roots become `<details>` elements,
/// and links become `<a>` elements.
void write_nav_html(HTML_Writer& out, const Nav_Item& item);

} // namespace lantern

#endif
