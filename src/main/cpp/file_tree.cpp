#include <algorithm>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "lantern/config.hpp"
#include "lantern/file_tree.hpp"
#include "lantern/url_path.hpp"

namespace lantern {
namespace {

void insert_file(std::vector<File_Node>& level, const Url_Path& relative, const std::filesystem::path& absolute)
{
    std::vector<File_Node>* current = &level;
    Url_Path prefix;
    const auto segments = relative.segments();
    for (std::size_t i = 0; i < segments.size(); ++i) {
        prefix.push_back(segments[i]);
        const bool is_file = i + 1 == segments.size();
        if (is_file) {
            current->push_back(File_Node {
                .name = segments[i],
                .relative_path = prefix,
                .absolute_path = absolute,
                .is_directory = false,
                .children = {},
            });
            return;
        }
        auto dir = std::ranges::find_if(*current, [&](const File_Node& node) {
            return node.is_directory && node.name == segments[i];
        });
        if (dir == current->end()) {
            current->push_back(File_Node {
                .name = segments[i],
                .relative_path = prefix,
                .absolute_path = {},
                .is_directory = true,
                .children = {},
            });
            dir = current->end() - 1;
        }
        current = &dir->children;
    }
}

void sort_nodes(std::vector<File_Node>& nodes)
{
    std::ranges::sort(nodes, [](const File_Node& x, const File_Node& y) {
        if (x.is_directory != y.is_directory) {
            return x.is_directory;
        }
        return x.name < y.name;
    });
    for (File_Node& node : nodes) {
        sort_nodes(node.children);
    }
}

void fill_directory_paths(std::vector<File_Node>& nodes, const std::filesystem::path& root_dir)
{
    for (File_Node& node : nodes) {
        if (node.is_directory) {
            node.absolute_path = root_dir / std::filesystem::path { node.relative_path.to_raw_string() };
            fill_directory_paths(node.children, root_dir);
        }
    }
}

} // namespace

Result<std::vector<File_Root>, Config_Error> scan_sources(std::span<const Source_Config> sources)
{
    std::vector<File_Root> result;
    for (const Source_Config& source : sources) {
        File_Root root { .name = source.name, .dir = source.dir, .children = {} };

        std::error_code error;
        std::filesystem::recursive_directory_iterator it {
            source.dir, std::filesystem::directory_options::skip_permission_denied, error
        };
        for (; !error && it != std::filesystem::recursive_directory_iterator {}; it.increment(error)) {
            if (!it->is_regular_file(error) || error) {
                error.clear();
                continue;
            }
            const std::u8string relative = it->path().lexically_relative(source.dir).generic_u8string();
            if (source.is_included(relative)) {
                insert_file(root.children, Url_Path::parse(relative), it->path());
            }
        }
        if (error) {
            std::u8string message = source.dir.generic_u8string();
            message += u8": the source directory of \"";
            message += source.name;
            message += u8"\" cannot be listed";
            return Config_Error { Config_Error_Code::io_error, std::move(message) };
        }

        sort_nodes(root.children);
        fill_directory_paths(root.children, root.dir);
        result.push_back(std::move(root));
    }
    return result;
}

} // namespace lantern
