#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "lantern/util/chars.hpp"
#include "lantern/util/html_writer.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/highlighting.hpp"
#include "lantern/markdown.hpp"
#include "lantern/services.hpp"

namespace lantern {
namespace {

enum struct List_Kind : Default_Underlying {
    none,
    unordered,
    ordered,
};

[[nodiscard]]
std::u8string_view list_tag(List_Kind kind)
{
    return kind == List_Kind::ordered ? u8"ol" : u8"ul";
}

/// @brief Returns the level of an ATX heading like `### Title`, or zero if `line` is none.
[[nodiscard]]
std::size_t heading_level(std::u8string_view line)
{
    std::size_t level = 0;
    while (level < line.size() && line[level] == u8'#') {
        ++level;
    }
    if (level == 0 || level > 6) {
        return 0;
    }
    return level == line.size() || is_ascii_inline_blank(line[level]) ? level : 0;
}

/// @brief If `line` is a list item, returns its kind and removes the marker from `line`.
[[nodiscard]]
List_Kind strip_list_marker(std::u8string_view& line)
{
    if ((line.starts_with(u8"- ") || line.starts_with(u8"* ")) && !line.starts_with(u8"* *")) {
        line.remove_prefix(2);
        return List_Kind::unordered;
    }
    std::size_t digits = 0;
    while (digits < line.size() && is_ascii_digit(line[digits])) {
        ++digits;
    }
    if (digits != 0 && line.substr(digits).starts_with(u8". ")) {
        line.remove_prefix(digits + 2);
        return List_Kind::ordered;
    }
    return List_Kind::none;
}

[[nodiscard]]
bool is_fence(std::u8string_view line)
{
    return line.starts_with(u8"```") || line.starts_with(u8"~~~");
}

/// @brief Renders the inline content of a block.
struct Inline_Renderer {
    HTML_Writer& out;

    void render(std::u8string_view text)
    {
        std::size_t plain_begin = 0;
        std::size_t i = 0;

        const auto flush_plain = [&] {
            if (i > plain_begin) {
                out.write_inner_text(text.substr(plain_begin, i - plain_begin));
            }
        };

        while (i < text.size()) {
            const std::u8string_view rest = text.substr(i);
            const std::size_t consumed = try_render_special(rest, flush_plain);
            if (consumed == 0) {
                ++i;
                continue;
            }
            i += consumed;
            plain_begin = i;
        }
        flush_plain();
    }

private:
    /// @brief Renders the inline construct at the start of `rest`, if any,
    /// and returns how many characters it consumed.
    /// `flush` is called before anything is written.
    template <typename Flush>
    std::size_t try_render_special(std::u8string_view rest, const Flush& flush)
    {
        switch (rest.front()) {
        case u8'`': {
            std::size_t ticks = 0;
            while (ticks < rest.size() && rest[ticks] == u8'`') {
                ++ticks;
            }
            const std::u8string_view fence = rest.substr(0, ticks);
            const std::size_t close = rest.find(fence, ticks);
            if (close == std::u8string_view::npos) {
                return 0;
            }
            flush();
            out.write_element(u8"code", trim_ascii_blank(rest.substr(ticks, close - ticks)));
            return close + ticks;
        }
        case u8'[': {
            const std::size_t text_end = rest.find(u8"](");
            if (text_end == std::u8string_view::npos) {
                return 0;
            }
            const std::size_t url_end = rest.find(u8')', text_end + 2);
            if (url_end == std::u8string_view::npos || rest.substr(1, text_end - 1).contains(u8'\n')) {
                return 0;
            }
            flush();
            const std::u8string_view url = trim_ascii_blank(rest.substr(text_end + 2, url_end - text_end - 2));
            out.open_tag_with_attributes(u8"a").write_href(url).end();
            Inline_Renderer { out }.render(rest.substr(1, text_end - 1));
            out.close_tag(u8"a");
            return url_end + 1;
        }
        case u8'*':
        case u8'_': {
            const bool strong = rest.size() > 2 && rest[1] == rest[0];
            const std::u8string_view delimiter = rest.substr(0, strong ? 2 : 1);
            if (rest.size() <= delimiter.size() || is_ascii_blank(rest[delimiter.size()])) {
                return 0;
            }
            const std::size_t close = rest.find(delimiter, delimiter.size());
            if (close == std::u8string_view::npos || close == delimiter.size()) {
                return 0;
            }
            // Underscores within identifiers like snake_case are not emphasis.
            if (rest[0] == u8'_' && close + delimiter.size() < rest.size()
                && is_cpp_ascii_identifier_character(rest[close + delimiter.size()])) {
                return 0;
            }
            flush();
            const std::u8string_view tag = strong ? u8"strong" : u8"em";
            out.open_tag(tag);
            Inline_Renderer { out }.render(rest.substr(delimiter.size(), close - delimiter.size()));
            out.close_tag(tag);
            return close + delimiter.size();
        }
        default: return 0;
        }
    }
};

struct Block_Renderer {
    HTML_Writer& out;
    const Syntax_Highlighter& highlighter;
    Logger& logger;
    std::pmr::memory_resource* memory;

    std::pmr::u8string paragraph { memory };
    List_Kind list = List_Kind::none;

    void flush_paragraph()
    {
        if (paragraph.empty()) {
            return;
        }
        out.open_tag(u8"p");
        Inline_Renderer { out }.render(paragraph);
        out.close_tag(u8"p");
        paragraph.clear();
    }

    void close_list()
    {
        if (list != List_Kind::none) {
            out.close_tag(list_tag(list));
            list = List_Kind::none;
        }
    }

    void render(std::u8string_view markdown)
    {
        std::u8string_view rest = markdown;
        while (!rest.empty()) {
            const std::size_t line_end = rest.find(u8'\n');
            std::u8string_view line = rest.substr(0, line_end);
            rest.remove_prefix(line_end == std::u8string_view::npos ? rest.size() : line_end + 1);
            if (line.ends_with(u8'\r')) {
                line.remove_suffix(1);
            }

            const std::u8string_view trimmed = trim_ascii_blank_left(line);
            if (is_fence(trimmed)) {
                flush_paragraph();
                close_list();
                render_code_block(trimmed, rest);
                continue;
            }
            if (is_ascii_blank(trimmed)) {
                flush_paragraph();
                close_list();
                continue;
            }
            if (const std::size_t level = heading_level(trimmed)) {
                flush_paragraph();
                close_list();
                const char8_t tag[] = { u8'h', char8_t(u8'0' + level) };
                const std::u8string_view tag_name { tag, 2 };
                out.open_tag(tag_name);
                Inline_Renderer { out }.render(trim_ascii_blank(trimmed.substr(level)));
                out.close_tag(tag_name);
                continue;
            }
            std::u8string_view item = trimmed;
            if (const List_Kind kind = strip_list_marker(item); kind != List_Kind::none) {
                flush_paragraph();
                if (kind != list) {
                    close_list();
                    out.open_tag(list_tag(kind));
                    list = kind;
                }
                out.open_tag(u8"li");
                Inline_Renderer { out }.render(trim_ascii_blank(item));
                out.close_tag(u8"li");
                continue;
            }
            close_list();
            if (!paragraph.empty()) {
                paragraph += u8'\n';
            }
            paragraph += trimmed;
        }
        flush_paragraph();
        close_list();
    }

    /// @brief Renders a fenced code block whose opening fence is `fence_line`,
    /// consuming lines from `rest` up to and including the closing fence.
    void render_code_block(std::u8string_view fence_line, std::u8string_view& rest)
    {
        const std::u8string_view fence = fence_line.substr(0, 3);
        const std::u8string_view language = trim_ascii_blank(fence_line.substr(3));

        std::size_t code_length = 0;
        std::u8string_view remaining = rest;
        bool closed = false;
        while (!remaining.empty()) {
            const std::size_t line_end = remaining.find(u8'\n');
            const std::u8string_view line = remaining.substr(0, line_end);
            const std::size_t consumed = line_end == std::u8string_view::npos ? remaining.size() : line_end + 1;
            if (trim_ascii_blank(line).starts_with(fence)) {
                remaining.remove_prefix(consumed);
                closed = true;
                break;
            }
            code_length += consumed;
            remaining.remove_prefix(consumed);
        }
        std::u8string_view code = rest.substr(0, code_length);
        if (closed && code.ends_with(u8'\n')) {
            code.remove_suffix(1);
        }
        rest = remaining;

        out.open_tag(u8"pre");
        if (language.empty()) {
            out.open_tag(u8"code");
        }
        else {
            std::pmr::u8string language_class { u8"language-", memory };
            language_class += language;
            out.open_tag_with_attributes(u8"code").write_class(language_class).end();
        }
        write_code(out, code, language, highlighter, logger, memory);
        out.close_tag(u8"code");
        out.close_tag(u8"pre");
    }
};

} // namespace

void render_markdown(
    HTML_Writer& out,
    std::u8string_view markdown,
    const Syntax_Highlighter& highlighter,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    Block_Renderer renderer { .out = out, .highlighter = highlighter, .logger = logger, .memory = memory };
    renderer.render(markdown);
}

void render_inline_markdown(HTML_Writer& out, std::u8string_view markdown)
{
    Inline_Renderer { out }.render(markdown);
}

} // namespace lantern
