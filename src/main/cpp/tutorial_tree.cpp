#include <algorithm>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include "lantern/util/chars.hpp"
#include "lantern/util/io.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/config.hpp"
#include "lantern/tutorial_tree.hpp"
#include "lantern/url_path.hpp"

namespace lantern {
namespace {

[[nodiscard]]
std::u8string_view next_line(std::u8string_view& rest)
{
    const std::size_t end = rest.find(u8'\n');
    std::u8string_view line = rest.substr(0, end);
    rest.remove_prefix(end == std::u8string_view::npos ? rest.size() : end + 1);
    if (line.ends_with(u8'\r')) {
        line.remove_suffix(1);
    }
    return line;
}

[[nodiscard]]
std::u8string_view unquote(std::u8string_view str)
{
    if (str.size() >= 2 && (str.front() == u8'"' || str.front() == u8'\'') && str.back() == str.front()) {
        return str.substr(1, str.size() - 2);
    }
    return str;
}

[[nodiscard]]
bool equals_ascii_case_insensitive(std::u8string_view x, std::u8string_view y)
{
    return std::ranges::equal(x, y, [](char8_t a, char8_t b) { return to_ascii_lower(a) == to_ascii_lower(b); });
}

[[nodiscard]]
std::u8string_view title_of(const Tutorial_Node& node)
{
    return std::visit([](const auto& v) -> std::u8string_view { return v.title; }, node.value);
}

struct Tutorial_Loader {
    std::u8string error_path;

    [[nodiscard]]
    std::optional<Tutorial> load_tutorial(const std::filesystem::path& file, const Url_Path& url)
    {
        std::pmr::monotonic_buffer_resource memory;
        Result<std::pmr::vector<char8_t>, IO_Error_Code> source = load_utf8_file(file, &memory);
        if (!source) {
            error_path = file.generic_u8string();
            return {};
        }
        const Markdown_Title split = extract_markdown_title(as_u8string_view(*source));
        return Tutorial {
            .title = split.title.empty() ? file.stem().generic_u8string() : std::u8string { split.title },
            .url = url,
            .file = file,
            .markdown = std::u8string { split.body },
        };
    }

    /// @brief Loads the folder at `dir`.
    /// Returns `false` if an error occurred, in which case `error_path` is set.
    [[nodiscard]]
    bool load_folder(Tutorial_Folder& folder, const std::filesystem::path& dir)
    {
        std::error_code error;
        std::filesystem::directory_iterator it { dir, error };
        std::vector<std::filesystem::directory_entry> entries;
        for (; !error && it != std::filesystem::directory_iterator {}; it.increment(error)) {
            entries.push_back(*it);
        }
        if (error) {
            error_path = dir.generic_u8string();
            return false;
        }
        std::ranges::sort(entries, {}, [](const std::filesystem::directory_entry& e) { return e.path(); });

        for (const std::filesystem::directory_entry& entry : entries) {
            const std::u8string file_name = entry.path().filename().generic_u8string();
            if (entry.is_directory(error)) {
                Tutorial_Folder child {
                    .title = file_name,
                    .url = folder.url.join(file_name),
                    .depth = folder.depth + 1,
                    .index = {},
                    .children = {},
                };
                if (!load_folder(child, entry.path())) {
                    return false;
                }
                if (child.index || !child.children.empty()) {
                    folder.children.push_back(Tutorial_Node { std::move(child) });
                }
                continue;
            }
            if (entry.path().extension() != u8".md"
                || equals_ascii_case_insensitive(file_name, u8"readme.md")) {
                continue;
            }
            if (equals_ascii_case_insensitive(file_name, u8"index.md")) {
                folder.index = load_tutorial(entry.path(), folder.url);
                if (!folder.index) {
                    return false;
                }
                folder.title = folder.index->title;
                continue;
            }
            std::optional<Tutorial> tutorial
                = load_tutorial(entry.path(), folder.url.join(Url_Path::parse(file_name).without_extension()));
            if (!tutorial) {
                return false;
            }
            folder.children.push_back(Tutorial_Node { std::move(*tutorial) });
        }

        std::ranges::stable_sort(folder.children, [](const Tutorial_Node& x, const Tutorial_Node& y) {
            const bool x_folder = std::holds_alternative<Tutorial_Folder>(x.value);
            const bool y_folder = std::holds_alternative<Tutorial_Folder>(y.value);
            if (x_folder != y_folder) {
                return x_folder;
            }
            return title_of(x) < title_of(y);
        });
        return true;
    }
};

} // namespace

Markdown_Title extract_markdown_title(std::u8string_view markdown)
{
    Markdown_Title result { .title = {}, .body = markdown };

    std::u8string_view rest = markdown;
    if (trim_ascii_blank_right(next_line(rest)) == u8"---") {
        std::u8string_view title;
        while (!rest.empty()) {
            const std::u8string_view line = next_line(rest);
            if (trim_ascii_blank_right(line) == u8"---") {
                result = { .title = title, .body = rest };
                break;
            }
            if (line.starts_with(u8"title:")) {
                title = unquote(trim_ascii_blank(line.substr(6)));
            }
        }
        // Unterminated front matter is treated as ordinary text.
    }
    if (!result.title.empty()) {
        return result;
    }

    rest = result.body;
    while (!rest.empty()) {
        const std::u8string_view line = trim_ascii_blank_left(next_line(rest));
        if (line.starts_with(u8"# ")) {
            result.title = trim_ascii_blank(line.substr(2));
            break;
        }
    }
    return result;
}

Result<Tutorial_Folder, Config_Error> load_tutorials(const Tutorials_Config& config)
{
    Tutorial_Folder root {
        .title = u8"Tutorials",
        .url = Url_Path { u8"tutorials" },
        .depth = 0,
        .index = {},
        .children = {},
    };
    Tutorial_Loader loader;
    if (!loader.load_folder(root, config.dir)) {
        std::u8string message = loader.error_path;
        message += u8": the tutorial file or directory cannot be read";
        return Config_Error { Config_Error_Code::io_error, std::move(message) };
    }
    return root;
}

} // namespace lantern
