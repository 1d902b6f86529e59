#ifndef LANTERN_FILE_TREE_HPP
#define LANTERN_FILE_TREE_HPP

#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/fwd.hpp"
#include "lantern/url_path.hpp"

namespace lantern {

/// @brief A file or directory within a source root.
struct File_Node {
    std::u8string name;
    /// @brief The path relative to the source root's directory.
    Url_Path relative_path;
    std::filesystem::path absolute_path;
    bool is_directory = false;
    /// @brief The contents of a directory, with directories first,
    /// and otherwise ordered by name.
    std::vector<File_Node> children;
};

/// @brief The documented files of one configured source.
/// Directories that contain no documented files are not part of the tree.
struct File_Root {
    std::u8string name;
    std::filesystem::path dir;
    std::vector<File_Node> children;
};

/// @brief Scans the directory of every source for documented files.
/// Fails if a source directory cannot be listed.
[[nodiscard]]
Result<std::vector<File_Root>, Config_Error> scan_sources(std::span<const Source_Config> sources);

} // namespace lantern

#endif
