#ifndef LANTERN_LEVENSHTEIN_HPP
#define LANTERN_LEVENSHTEIN_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory_resource>
#include <ranges>
#include <utility>
#include <vector>

namespace lantern {

// https://en.wikipedia.org/wiki/Levenshtein_distance

/// @brief Computes the Levenshtein distance between `x` and `y`,
/// i.e. the minimum number of single-element insertions, deletions, or substitutions
/// required to turn `x` into `y`.
/// Only two rows of the distance matrix are kept alive at any time.
// clang-format off
template <std::ranges::random_access_range R1, std::ranges::random_access_range R2>
  requires std::equality_comparable_with<std::ranges::range_value_t<R1>, std::ranges::range_value_t<R2>>
[[nodiscard]]
std::size_t levenshtein_distance(const R1& x, const R2& y, std::pmr::memory_resource* memory)
{
    const auto x_size = std::size_t(std::ranges::size(x));
    const auto y_size = std::size_t(std::ranges::size(y));

    if (x_size == 0) {
        return y_size;
    }
    if (y_size == 0) {
        return x_size;
    }

    std::pmr::vector<std::size_t> previous(y_size + 1, memory);
    std::pmr::vector<std::size_t> current(y_size + 1, memory);
    for (std::size_t j = 0; j <= y_size; ++j) {
        previous[j] = j;
    }

    const auto x_begin = std::ranges::begin(x);
    const auto y_begin = std::ranges::begin(y);

    for (std::size_t i = 1; i <= x_size; ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= y_size; ++j) {
            const auto i_minus = std::ranges::range_difference_t<R1>(i - 1);
            const auto j_minus = std::ranges::range_difference_t<R2>(j - 1);
            const std::size_t sub_cost = x_begin[i_minus] != y_begin[j_minus];
            current[j] = std::min({
                previous[j    ] + 1,        // deletion
                current [j - 1] + 1,        // insertion
                previous[j - 1] + sub_cost  // substitution
            });
        }
        std::swap(previous, current);
    }

    return previous[y_size];
}
// clang-format on

} // namespace lantern

#endif
