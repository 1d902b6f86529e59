#ifndef LANTERN_TUTORIAL_TREE_HPP
#define LANTERN_TUTORIAL_TREE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/fwd.hpp"
#include "lantern/settings.hpp"
#include "lantern/url_path.hpp"

namespace lantern {

/// @brief A hand-written markdown page.
struct Tutorial {
    std::u8string title;
    /// @brief The site-relative URL, like `tutorials/basics/setup`.
    Url_Path url;
    std::filesystem::path file;
    /// @brief The markdown source, without front matter.
    std::u8string markdown;
};

struct Tutorial_Node;

/// @brief A directory of tutorials.
struct Tutorial_Folder {
    std::u8string title;
    Url_Path url;
    /// @brief The nesting depth, where the tutorials directory itself has depth zero.
    std::size_t depth = 0;
    /// @brief The contents of `index.md`, which is shown as the page of the folder.
    std::optional<Tutorial> index;
    std::vector<Tutorial_Node> children;

    /// @brief Returns `true` if the folder is expanded in the navigation by default.
    [[nodiscard]]
    bool is_open() const noexcept
    {
        return depth < nav_open_depth;
    }
};

struct Tutorial_Node {
    std::variant<Tutorial, Tutorial_Folder> value;
};

/// @brief The result of splitting a markdown file into front matter and body.
struct Markdown_Title {
    /// @brief The title from front matter or from the first `# ` heading, or empty.
    std::u8string_view title;
    /// @brief The markdown without front matter.
    std::u8string_view body;
};

/// @brief Extracts the title of a tutorial.
/// The title is taken from a `title:` line in YAML front matter delimited by `---` lines,
/// or otherwise from the first level-one heading.
[[nodiscard]]
Markdown_Title extract_markdown_title(std::u8string_view markdown);

/// @brief Loads the tutorials in `config.dir`.
/// Only `.md` files are tutorials, and `README.md` files are skipped.
/// An `index.md` file becomes the page of its folder.
/// Folders that contain no tutorials are dropped.
[[nodiscard]]
Result<Tutorial_Folder, Config_Error> load_tutorials(const Tutorials_Config& config);

} // namespace lantern

#endif
