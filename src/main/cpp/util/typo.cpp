#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "lantern/util/levenshtein.hpp"
#include "lantern/util/strings.hpp"
#include "lantern/util/typo.hpp"
#include "lantern/util/unicode.hpp"

namespace lantern {

namespace {

void to_utf32(std::pmr::u32string& out, std::u8string_view str)
{
    out.clear();
    out.reserve(str.size());
    std::ranges::copy(utf8::Code_Point_View { str }, std::back_inserter(out));
}

} // namespace

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    const bool needle_is_ascii = is_ascii(needle);

    std::pmr::u32string needle32 { memory };
    std::pmr::u32string hay32 { memory };
    if (!needle_is_ascii) {
        to_utf32(needle32, needle);
    }

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::u8string_view hay = haystack[i];
        const std::size_t distance = [&] -> std::size_t {
            if (needle_is_ascii && is_ascii(hay)) {
                return levenshtein_distance(hay, needle, memory);
            }
            if (needle_is_ascii) {
                to_utf32(needle32, needle);
            }
            to_utf32(hay32, hay);
            return levenshtein_distance(hay32, needle32, memory);
        }();

        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace lantern
