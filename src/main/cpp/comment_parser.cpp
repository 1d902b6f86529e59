#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/assert.hpp"
#include "lantern/util/chars.hpp"
#include "lantern/util/strings.hpp"
#include "lantern/util/typo.hpp"

#include "lantern/diagnostic.hpp"
#include "lantern/doc_comment.hpp"
#include "lantern/services.hpp"
#include "lantern/settings.hpp"

namespace lantern {
namespace {

enum struct Tag : Default_Underlying {
    description,
    param,
    tparam,
    returns,
    throws,
    see,
    note,
    warning,
    version,
    since,
    example,
};

struct Tag_Info {
    std::u8string_view name;
    Tag tag;
};

constexpr Tag_Info tag_infos[] {
    { u8"description", Tag::description },
    { u8"desc", Tag::description },
    { u8"param", Tag::param },
    { u8"arg", Tag::param },
    { u8"tparam", Tag::tparam },
    { u8"targ", Tag::tparam },
    { u8"return", Tag::returns },
    { u8"returns", Tag::returns },
    { u8"throws", Tag::throws },
    { u8"see", Tag::see },
    { u8"note", Tag::note },
    { u8"warning", Tag::warning },
    { u8"warn", Tag::warning },
    { u8"version", Tag::version },
    { u8"since", Tag::since },
    { u8"example", Tag::example },
    { u8"code", Tag::example },
};

constexpr auto tag_names = [] {
    std::array<std::u8string_view, std::size(tag_infos)> result;
    std::ranges::transform(tag_infos, result.begin(), &Tag_Info::name);
    return result;
}();

[[nodiscard]]
std::optional<Tag> find_tag(std::u8string_view name)
{
    const auto it = std::ranges::find(tag_infos, name, &Tag_Info::name);
    return it == std::end(tag_infos) ? std::optional<Tag> {} : it->tag;
}

[[nodiscard]]
bool tag_takes_name(Tag tag)
{
    return tag == Tag::param || tag == Tag::tparam;
}

[[nodiscard]]
std::u8string_view remove_line_comment_marker(std::u8string_view line)
{
    const std::u8string_view trimmed = trim_ascii_blank_left(line);
    for (const std::u8string_view marker : { u8"///", u8"//!", u8"//" }) {
        if (trimmed.starts_with(marker)) {
            return trimmed.substr(marker.size());
        }
    }
    return line;
}

[[nodiscard]]
std::u8string_view remove_block_comment_star(std::u8string_view line)
{
    const std::u8string_view trimmed = trim_ascii_blank_left(line);
    return trimmed.starts_with(u8'*') ? trimmed.substr(1) : line;
}

/// @brief Removes the common indentation of all non-blank lines in `code`.
[[nodiscard]]
std::pmr::u8string dedent(std::u8string_view code, std::pmr::memory_resource* memory)
{
    std::size_t common = std::u8string_view::npos;
    for (std::u8string_view rest = code; !rest.empty();) {
        const std::size_t line_end = std::min(rest.find(u8'\n'), rest.size());
        const std::u8string_view line = rest.substr(0, line_end);
        if (!is_ascii_blank(line)) {
            common = std::min(common, length_blank_left(line));
        }
        rest.remove_prefix(std::min(line_end + 1, rest.size()));
    }

    std::pmr::u8string result { memory };
    for (std::u8string_view rest = code; !rest.empty();) {
        const std::size_t line_end = std::min(rest.find(u8'\n'), rest.size());
        std::u8string_view line = rest.substr(0, line_end);
        line.remove_prefix(std::min(common, length_blank_left(line)));
        if (!result.empty()) {
            result += u8'\n';
        }
        result += line;
        rest.remove_prefix(std::min(line_end + 1, rest.size()));
    }
    return result;
}

struct Comment_Parser {
    std::u8string_view text;
    std::size_t pos = 0;
    Logger& logger;
    Source_Location location;
    std::pmr::memory_resource* memory;
    Doc_Comment& result;

    [[nodiscard]]
    bool at_end() const
    {
        return pos >= text.size();
    }

    [[nodiscard]]
    char8_t peek() const
    {
        return text[pos];
    }

    void skip_whitespace()
    {
        while (!at_end() && is_ascii_blank(peek())) {
            ++pos;
        }
    }

    void skip_inline_whitespace()
    {
        while (!at_end() && is_ascii_inline_blank(peek())) {
            ++pos;
        }
    }

    template <typename Predicate>
    [[nodiscard]]
    std::u8string_view read_until(Predicate stop)
    {
        const std::size_t begin = pos;
        while (!at_end() && !stop(peek())) {
            ++pos;
        }
        return text.substr(begin, pos - begin);
    }

    [[nodiscard]]
    std::u8string_view read_raw_value()
    {
        return read_until([](char8_t c) { return c == u8'@'; });
    }

    [[nodiscard]]
    std::pmr::u8string read_value(std::u8string_view tag_name)
    {
        skip_whitespace();
        const std::u8string_view value = trim_ascii_blank(read_raw_value());
        if (value.empty()) {
            warn_missing(diagnostic::comment_value_missing, u8"value", tag_name);
        }
        return std::pmr::u8string { value, memory };
    }

    [[nodiscard]]
    std::pmr::u8string read_example(std::u8string_view tag_name)
    {
        skip_inline_whitespace();
        const std::u8string_view code = trim_ascii_blank_right(trim_blank_lines_left(read_raw_value()));
        if (code.empty()) {
            warn_missing(diagnostic::comment_value_missing, u8"value", tag_name);
        }
        return dedent(code, memory);
    }

    [[nodiscard]]
    std::pmr::u8string read_name(std::u8string_view tag_name)
    {
        skip_whitespace();
        const std::u8string_view name
            = read_until([](char8_t c) { return is_ascii_blank(c) || c == u8'@'; });
        if (name.empty()) {
            warn_missing(diagnostic::comment_param_missing, u8"parameter name", tag_name);
        }
        return std::pmr::u8string { name, memory };
    }

    void warn_missing(std::u8string_view id, std::u8string_view what, std::u8string_view tag_name)
    {
        if (!logger.can_log(Severity::warning)) {
            return;
        }
        std::pmr::u8string message { u8"Expected a ", memory };
        message += what;
        message += u8" for \"@";
        message += tag_name;
        message += u8"\". An empty one is used instead.";
        logger.log(Severity::warning, id, message, location);
    }

    void warn_unknown_tag(std::u8string_view tag_name)
    {
        if (!logger.can_log(Severity::warning)) {
            return;
        }
        std::pmr::u8string message { u8"Unknown documentation tag \"@", memory };
        message += tag_name;
        message += u8"\".";
        const Distant<std::size_t> match = closest_match(tag_names, tag_name, memory);
        if (match && match.distance <= max_tag_typo_distance) {
            message += u8" Did you mean \"@";
            message += tag_names[match.value];
            message += u8"\"?";
        }
        message += u8" The tag and its text are ignored.";
        logger.log(Severity::warning, diagnostic::comment_tag_unknown, message, location);
    }

    void warn_unknown_attribute(std::u8string_view attribute, std::u8string_view tag_name)
    {
        if (!logger.can_log(Severity::warning)) {
            return;
        }
        std::pmr::u8string message { u8"Unknown attribute \"", memory };
        message += attribute;
        message += u8"\" for \"@";
        message += tag_name;
        message += u8"\". It is ignored.";
        logger.log(Severity::warning, diagnostic::comment_attribute_unknown, message, location);
    }

    /// @brief Parses an attribute list like `[analyze]`, if there is one at the current position.
    /// Returns whether the `analyze` attribute was set.
    [[nodiscard]]
    bool parse_attributes(std::u8string_view tag_name, bool accepts_analyze)
    {
        if (at_end() || peek() != u8'[') {
            return false;
        }
        ++pos;
        std::u8string_view list
            = read_until([](char8_t c) { return c == u8']' || c == u8'\n' || c == u8'@'; });
        if (!at_end() && peek() == u8']') {
            ++pos;
        }

        bool analyze = false;
        while (!list.empty()) {
            const std::size_t comma = std::min(list.find(u8','), list.size());
            const std::u8string_view attribute = trim_ascii_blank(list.substr(0, comma));
            list.remove_prefix(std::min(comma + 1, list.size()));
            if (attribute.empty()) {
                continue;
            }

            const std::size_t equals = attribute.find(u8'=');
            const std::u8string_view key = trim_ascii_blank(attribute.substr(0, equals));
            const std::u8string_view value = equals == std::u8string_view::npos
                ? std::u8string_view { u8"true" }
                : trim_ascii_blank(attribute.substr(equals + 1));

            if (accepts_analyze && key == u8"analyze") {
                analyze = value != u8"false";
            }
            else {
                warn_unknown_attribute(key, tag_name);
            }
        }
        return analyze;
    }

    void append_description(std::pmr::u8string&& text)
    {
        if (text.empty()) {
            return;
        }
        if (!result.description) {
            result.description = std::move(text);
            return;
        }
        *result.description += u8"\n\n";
        *result.description += text;
    }

    void parse_command()
    {
        if (peek() != u8'@') {
            append_description(read_value(u8"description"));
            return;
        }

        ++pos;
        const std::u8string_view tag_name = read_until([](char8_t c) {
            return is_ascii_blank(c) || c == u8'[' || c == u8'@';
        });
        const std::optional<Tag> tag = find_tag(tag_name);
        if (!tag) {
            warn_unknown_tag(tag_name);
            (void)parse_attributes(tag_name, false);
            (void)read_raw_value();
            return;
        }
        const bool analyze = parse_attributes(tag_name, *tag == Tag::example);

        if (tag_takes_name(*tag)) {
            Doc_Param param { .name = read_name(tag_name), .text = read_value(tag_name) };
            (*tag == Tag::param ? result.params : result.tparams).push_back(std::move(param));
            return;
        }

        switch (*tag) {
        case Tag::description: append_description(read_value(tag_name)); break;
        case Tag::returns: result.returns = read_value(tag_name); break;
        case Tag::throws: result.throws = read_value(tag_name); break;
        case Tag::see: result.see.push_back(read_value(tag_name)); break;
        case Tag::note: result.notes.push_back(read_value(tag_name)); break;
        case Tag::warning: result.warnings.push_back(read_value(tag_name)); break;
        case Tag::version: result.version = read_value(tag_name); break;
        case Tag::since: result.since = read_value(tag_name); break;
        case Tag::example: {
            result.examples.push_back(Doc_Example { .code = read_example(tag_name), .analyze = analyze });
            break;
        }
        case Tag::param:
        case Tag::tparam: LANTERN_ASSERT_UNREACHABLE(u8"Named tags were handled above.");
        }
    }

    void parse()
    {
        while (true) {
            skip_whitespace();
            if (at_end()) {
                break;
            }
            parse_command();
        }
    }
};

} // namespace

std::pmr::u8string strip_comment_markers(std::u8string_view raw, std::pmr::memory_resource* memory)
{
    raw = trim_ascii_blank(raw);
    const bool is_block = raw.starts_with(u8"/*");
    if (is_block) {
        raw.remove_prefix(raw.starts_with(u8"/**") || raw.starts_with(u8"/*!") ? 3 : 2);
        if (raw.ends_with(u8"*/")) {
            raw.remove_suffix(2);
        }
    }

    std::pmr::vector<std::u8string_view> lines { memory };
    for (std::u8string_view rest = raw; true;) {
        const std::size_t line_end = rest.find(u8'\n');
        std::u8string_view line = rest.substr(0, line_end);
        if (line.ends_with(u8'\r')) {
            line.remove_suffix(1);
        }
        lines.push_back(is_block ? remove_block_comment_star(line) : remove_line_comment_marker(line));
        if (line_end == std::u8string_view::npos) {
            break;
        }
        rest.remove_prefix(line_end + 1);
    }

    const auto first_content
        = std::ranges::find_if(lines, [](std::u8string_view line) { return !is_ascii_blank(line); });
    const std::size_t indentation = first_content == lines.end() ? 0 : length_blank_left(*first_content);

    std::pmr::u8string result { memory };
    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::u8string_view line = lines[i];
        line.remove_prefix(std::min(indentation, length_blank_left(line)));
        if (i != 0) {
            result += u8'\n';
        }
        result += trim_ascii_blank_right(line);
    }
    return result;
}

Doc_Comment parse_doc_comment(
    std::u8string_view raw,
    Logger& logger,
    Source_Location location,
    std::pmr::memory_resource* memory
)
{
    const std::pmr::u8string text = strip_comment_markers(raw, memory);
    Doc_Comment result { memory };
    Comment_Parser parser {
        .text = text, .pos = 0, .logger = logger, .location = location, .memory = memory, .result = result
    };
    parser.parse();
    return result;
}

} // namespace lantern
