#ifndef LANTERN_ENTRY_HPP
#define LANTERN_ENTRY_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "lantern/util/html_writer.hpp"

#include "lantern/build_context.hpp"
#include "lantern/fwd.hpp"
#include "lantern/nav.hpp"
#include "lantern/url_path.hpp"

namespace lantern {

/// @brief The landing page at the root of the site.
struct Index_Entry { };

/// @brief A namespace, or the global namespace if `symbol` is the root of the graph.
/// The global namespace has no page of its own.
struct Namespace_Entry {
    const Symbol* symbol;
};

/// @brief A class or struct.
struct Record_Entry {
    const Symbol* symbol;
};

struct Function_Entry {
    const Symbol* symbol;
};

/// @brief A documented source file.
struct File_Entry {
    const File_Root* root;
    const File_Node* node;
};

/// @brief A directory of source files, which has no page of its own.
struct Directory_Entry {
    const File_Root* root;
    const File_Node* node;
};

/// @brief The files of one configured source, which have no page of their own.
struct File_Root_Entry {
    const File_Root* root;
};

struct Tutorial_Entry {
    const Tutorial* tutorial;
};

/// @brief A folder of tutorials, which has a page if it contains an `index.md`.
struct Tutorial_Folder_Entry {
    const Tutorial_Folder* folder;
};

/// @brief The title and description of a page, as shown in the document head.
struct Page_Info {
    std::u8string title;
    std::u8string description;
};

/// @brief A documentation unit.
/// An entry produces at most one page, and containers like namespaces and directories
/// recurse into the entries they contain.
///
/// Entries refer to the data of a `Build_Context` and cannot outlive it.
struct Entry {
    std::variant<
        Index_Entry,
        Namespace_Entry,
        Record_Entry,
        Function_Entry,
        File_Entry,
        Directory_Entry,
        File_Root_Entry,
        Tutorial_Entry,
        Tutorial_Folder_Entry>
        value;

    /// @brief Returns the name to display in the navigation and page headings.
    [[nodiscard]]
    std::u8string_view name() const noexcept;

    /// @brief Returns the site-relative URL of the page of this entry.
    [[nodiscard]]
    Url_Path url(const Build_Context& context) const;

    /// @brief Returns `true` if the entry produces a page.
    [[nodiscard]]
    bool has_page() const noexcept;

    /// @brief Returns the entries contained in this one, in navigation order.
    [[nodiscard]]
    std::vector<Entry> children(const Build_Context& context) const;

    /// @brief Returns the contribution of this entry to the navigation sidebar.
    [[nodiscard]]
    Nav_Item nav(const Build_Context& context) const;

    /// @brief Schedules the generation of the page of this entry (if any)
    /// and of all pages of the entries it contains.
    /// @return The handles of the scheduled tasks.
    [[nodiscard]]
    std::vector<Page_Task> build(Builder& builder) const;

    /// @brief Returns the title and description of the page.
    [[nodiscard]]
    Page_Info page_info(const Build_Context& context) const;

    /// @brief Writes the body of the page, which is substituted into the page template as
    /// `main_content`.
    /// Problems with the documentation itself, like unknown comment tags, are logged,
    /// but never prevent the page from being written.
    void write_content(
        HTML_Writer& out,
        const Build_Context& context,
        std::pmr::memory_resource* memory
    ) const;
};

/// @brief Returns the top-level entries of a build:
/// the index, the global namespace, the roots of the file tree, and the tutorials.
[[nodiscard]]
std::vector<Entry> make_root_entries(const Build_Context& context);

} // namespace lantern

#endif
