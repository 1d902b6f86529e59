#include <cstddef>
#include <memory_resource>
#include <random>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "lantern/util/levenshtein.hpp"

namespace lantern {
namespace {

TEST(Levenshtein, empty)
{
    constexpr std::u8string_view x;
    constexpr std::u8string_view y;
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 0);
}

TEST(Levenshtein, create)
{
    constexpr std::u8string_view x;
    constexpr std::u8string_view y = u8"abcdefg";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 7);
}

TEST(Levenshtein, zero_distance)
{
    constexpr std::u8string_view x = u8"abcdefg";
    constexpr std::u8string_view y = u8"abcdefg";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 0);
}

TEST(Levenshtein, substitute)
{
    constexpr std::u8string_view x = u8"param";
    constexpr std::u8string_view y = u8"parem";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 1);
}

TEST(Levenshtein, insert)
{
    constexpr std::u8string_view x = u8"abcd";
    constexpr std::u8string_view y = u8"a1b2c3d";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 3);
}

TEST(Levenshtein, code_points)
{
    constexpr std::u32string_view x = U"∑∏";
    constexpr std::u32string_view y = U"∏";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 1);
}

// Verifies that distance computations are commutative.
TEST(Levenshtein, commutative_fuzzing)
{
    constexpr int iterations = 100;

    std::pmr::monotonic_buffer_resource memory;

    std::default_random_engine rng { 12345 };
    std::uniform_int_distribution<unsigned> distr { 0, 127 };

    for (int i = 0; i < iterations; ++i) {
        memory.release();

        std::pmr::u8string x { &memory };
        std::pmr::u8string y { &memory };
        x.resize(distr(rng) % 32);
        y.resize(distr(rng) % 32);
        for (char8_t& c : x) {
            c = char8_t(distr(rng) % 4 + u8'a');
        }
        for (char8_t& c : y) {
            c = char8_t(distr(rng) % 4 + u8'a');
        }

        EXPECT_EQ(levenshtein_distance(x, y, &memory), levenshtein_distance(y, x, &memory));
    }
}

} // namespace
} // namespace lantern
