#ifndef LANTERN_LINKER_HPP
#define LANTERN_LINKER_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/fwd.hpp"
#include "lantern/url_path.hpp"

namespace lantern {

/// @brief A directory that contains documented sources.
struct Source_Root {
    /// @brief The display name, which also determines the URL of the file pages.
    std::u8string name;
    /// @brief The absolute path of the directory.
    Url_Path dir;
    /// @brief A prefix which is removed from include paths,
    /// such as `include` when headers are included as `<lib/x.hpp>` rather than
    /// `<include/lib/x.hpp>`.
    Url_Path strip_include_prefix;
};

struct Linker_Options {
    /// @brief The URL at which the generated site is hosted, like `/docs`.
    Url_Path output_url;
    std::vector<Source_Root> roots;
    /// @brief Outermost namespaces whose symbols are documented elsewhere, like `std`.
    std::vector<std::u8string> external_namespaces;
    /// @brief The site that documents `external_namespaces`.
    std::u8string external_url;
    /// @brief A URL template for viewing source files online.
    /// The first `{path}` is replaced with the project-relative path of the file;
    /// if there is none, the path is appended.
    std::u8string tree_url;
    /// @brief The project directory, relative to which `tree_url` paths are formed.
    Url_Path project_dir;
};

/// @brief Derives the URLs and include paths of symbols.
/// A `Linker` is immutable and may be shared between threads.
struct Linker {
private:
    Linker_Options m_options;

public:
    [[nodiscard]]
    explicit Linker(Linker_Options options);

    [[nodiscard]]
    const Linker_Options& options() const noexcept
    {
        return m_options;
    }

    /// @brief Returns the site-relative URL of the page that documents `symbol`,
    /// like `class/ns/Foo`.
    /// Members are documented on the page of their class or struct.
    [[nodiscard]]
    Url_Path rel_url(const Symbol& symbol) const;

    /// @brief Returns the anchor of `symbol` within its page,
    /// or an empty string if it has a page of its own.
    [[nodiscard]]
    std::u8string_view anchor(const Symbol& symbol) const noexcept;

    /// @brief Returns `true` if `symbol` lies in one of the external namespaces,
    /// in which case it has no page of its own.
    [[nodiscard]]
    bool is_external(const Symbol& symbol) const noexcept;

    /// @brief Returns `abs_url(symbol, options().output_url)`.
    [[nodiscard]]
    Url_Path abs_url(const Symbol& symbol) const;

    /// @brief Returns `rel_url(symbol)` joined onto `base`,
    /// or for external symbols, the URL of their page on the external reference site.
    [[nodiscard]]
    Url_Path abs_url(const Symbol& symbol, const Url_Path& base) const;

    /// @brief Returns the encoded absolute URL of `symbol`, including its anchor,
    /// suitable for `href` attributes.
    [[nodiscard]]
    std::u8string href(const Symbol& symbol) const;

    /// @brief Returns the include path of the header that defines `symbol`,
    /// like `lib/x.hpp`, or `std::nullopt` if it lies in none of the source roots.
    [[nodiscard]]
    std::optional<Url_Path> header_path(const Symbol& symbol) const;

    [[nodiscard]]
    std::optional<Url_Path> header_path(std::u8string_view file) const;

    /// @brief Returns the source root that contains `file`, or `nullptr`.
    [[nodiscard]]
    const Source_Root* root_of(std::u8string_view file) const noexcept;

    /// @brief Returns a URL for viewing the source of `symbol` online,
    /// or `std::nullopt` if no such URL can be formed.
    [[nodiscard]]
    std::optional<std::u8string> source_url(const Symbol& symbol) const;

    [[nodiscard]]
    std::optional<std::u8string> source_url(std::u8string_view file) const;

    /// @brief Returns the site-relative URL of the page for a source file,
    /// like `files/src/lib/x.hpp`.
    /// @param root_name The name of the root that contains the file.
    /// @param relative The path of the file relative to the directory of the root.
    [[nodiscard]]
    Url_Path file_url(std::u8string_view root_name, const Url_Path& relative) const;

    /// @brief Returns the site-relative URL `relative` joined onto `options().output_url`.
    [[nodiscard]]
    Url_Path page_url(const Url_Path& relative) const;

    /// @brief Looks up a referenced symbol by qualified name.
    /// If there is no such symbol, a `link.unresolved` warning is logged and `nullptr` returned.
    [[nodiscard]]
    const Symbol* resolve(
        const Symbol_Graph& graph,
        std::span<const std::u8string> qualified_name,
        Logger& logger
    ) const;
};

} // namespace lantern

#endif
