#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "lantern/util/chars.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/autolink.hpp"
#include "lantern/linker.hpp"
#include "lantern/symbol_graph.hpp"

namespace lantern {
namespace {

[[nodiscard]]
std::size_t count_backticks(std::u8string_view text, std::size_t pos)
{
    std::size_t result = 0;
    while (pos + result < text.size() && text[pos + result] == u8'`') {
        ++result;
    }
    return result;
}

/// @brief Returns `true` if `c` is part of a word.
/// Non-ASCII code units are, so that no word is split in the middle of a UTF-8 sequence.
[[nodiscard]]
bool is_word_character(char8_t c)
{
    return c >= 0x80 || is_cpp_ascii_identifier_character(c);
}

} // namespace

std::pmr::vector<Autolink_Token> tokenize_for_autolink(std::u8string_view text, std::pmr::memory_resource* memory)
{
    std::pmr::vector<Autolink_Token> result { memory };

    // The length of the backtick run that opened the current code span, or zero.
    std::size_t code_fence = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const char8_t c = text[i];
        if (c == u8'`') {
            const std::size_t run = count_backticks(text, i);
            if (code_fence == 0) {
                code_fence = run;
            }
            else if (run == code_fence) {
                code_fence = 0;
            }
            i += run;
            continue;
        }
        if (code_fence != 0) {
            ++i;
            continue;
        }
        if (c == u8']' && i + 1 < text.size() && text[i + 1] == u8'(') {
            const std::size_t close = text.find(u8')', i + 2);
            i = close == std::u8string_view::npos ? text.size() : close + 1;
            continue;
        }
        if (!is_word_character(c)) {
            ++i;
            continue;
        }
        const std::size_t begin = i;
        while (i < text.size() && is_word_character(text[i])) {
            ++i;
        }
        result.push_back({ .begin = begin, .length = i - begin, .value = nullptr });
    }
    return result;
}

std::pmr::u8string apply_replacements(
    std::u8string_view text,
    std::span<const Replacement> replacements,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string result { text, memory };
    // Every replacement shifts the ones after it by the difference in length.
    std::ptrdiff_t delta = 0;
    for (const Replacement& r : replacements) {
        const auto begin = static_cast<std::size_t>(std::ptrdiff_t(r.begin) + delta);
        result.replace(begin, r.length, r.value);
        delta += std::ptrdiff_t(r.value.size()) - std::ptrdiff_t(r.length);
    }
    return result;
}

std::pmr::u8string Autolinker::operator()(std::u8string_view text, std::pmr::memory_resource* memory) const
{
    std::pmr::vector<Autolink_Token> tokens = tokenize_for_autolink(text, memory);
    if (tokens.empty()) {
        return std::pmr::u8string { text, memory };
    }

    std::pmr::unordered_set<std::u8string_view> linked_names { memory };
    std::pmr::vector<Replacement> replacements { memory };

    const auto claim = [&](const Symbol& symbol) {
        const std::u8string_view name = symbol.name();
        if (name.empty() || is_ascii_lowercase_only(name) || linked_names.contains(name)) {
            return;
        }
        const auto token = std::ranges::find_if(tokens, [&](const Autolink_Token& t) {
            return t.value == nullptr && text.substr(t.begin, t.length) == name;
        });
        if (token == tokens.end()) {
            return;
        }
        token->value = &symbol;
        linked_names.insert(name);

        std::pmr::u8string link { memory };
        link += u8'[';
        link += name;
        link += u8"](";
        link += m_linker.href(symbol);
        link += u8')';
        replacements.push_back({ .begin = token->begin, .length = token->length, .value = std::move(link) });
    };
    m_graph.for_each(claim);

    std::ranges::sort(replacements, {}, &Replacement::begin);
    return apply_replacements(text, replacements, memory);
}

} // namespace lantern
