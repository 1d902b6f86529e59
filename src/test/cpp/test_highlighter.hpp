#ifndef LANTERN_TEST_HIGHLIGHTER_HPP
#define LANTERN_TEST_HIGHLIGHTER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "lantern/util/result.hpp"
#include "lantern/util/typo.hpp"

#include "lantern/fwd.hpp"
#include "lantern/services.hpp"

namespace lantern {

/// @brief Runs syntax highlighting for code of a test-only language
/// where sequences of the character `x` are considered keywords.
/// Nothing else is highlighted.
inline void highlight_x(std::pmr::vector<Highlight_Span>& out, std::u8string_view code)
{
    char8_t prev = 0;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < code.size(); ++i) {
        if (code[i] == u8'x' && prev != u8'x') {
            begin = i;
        }
        if (code[i] != u8'x' && prev == u8'x') {
            const Highlight_Span span { .begin = begin,
                                        .length = i - begin,
                                        .type = Default_Underlying(Highlight_Type::keyword) };
            out.push_back(span);
        }
        prev = code[i];
    }
    if (prev == u8'x') {
        const Highlight_Span span { .begin = begin,
                                    .length = code.size() - begin,
                                    .type = Default_Underlying(Highlight_Type::keyword) };
        out.push_back(span);
    }
}

/// @brief Supports the language `x`, see `highlight_x`,
/// and the language `broken`, which always fails as if the code was malformed.
struct [[nodiscard]]
Test_Highlighter final : Syntax_Highlighter {
    static constexpr std::u8string_view supported[] { u8"x", u8"broken" };

    [[nodiscard]]
    std::span<const std::u8string_view> get_supported_languages() const final
    {
        return supported;
    }

    [[nodiscard]]
    Distant<std::u8string_view> match_supported_language(
        std::u8string_view language,
        std::pmr::memory_resource* memory
    ) const final
    {
        const Distant<std::size_t> match = closest_match(supported, language, memory);
        return { supported[match.value], match.distance };
    }

    [[nodiscard]]
    Result<void, Syntax_Highlight_Error> operator()(
        std::pmr::vector<Highlight_Span>& out,
        std::u8string_view code,
        std::u8string_view language,
        std::pmr::memory_resource*
    ) const final
    {
        if (language == u8"x") {
            highlight_x(out, code);
            return {};
        }
        if (language == u8"broken") {
            return Syntax_Highlight_Error::bad_code;
        }
        return Syntax_Highlight_Error::unsupported_language;
    }
};

inline constinit const Test_Highlighter test_highlighter;

} // namespace lantern

#endif
