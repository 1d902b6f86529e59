#ifndef LANTERN_GLOB_HPP
#define LANTERN_GLOB_HPP

#include <string>
#include <string_view>

#include "lantern/util/result.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

enum struct Glob_Error_Code : Default_Underlying {
    /// @brief The pattern could not be compiled.
    bad_pattern,
};

/// @brief Translates a glob pattern into an ECMAScript regular expression
/// that matches the whole of a `/`-separated path.
/// - `**/` matches zero or more directories,
/// - `**` matches any sequence of characters,
/// - `*` matches any sequence of characters except `/`,
/// - `?` matches any single character except `/`, and
/// - every other character matches itself.
[[nodiscard]]
std::u8string glob_to_regex(std::u8string_view glob);

struct In_Place_Tag { };

struct Glob_Impl {
private:
    alignas(8) unsigned char m_storage[16];

public:
    Glob_Impl() noexcept;
    Glob_Impl(const Glob_Impl&) noexcept;
    Glob_Impl(Glob_Impl&&) noexcept;

    Glob_Impl& operator=(const Glob_Impl&) noexcept;
    Glob_Impl& operator=(Glob_Impl&&) noexcept;

    ~Glob_Impl();

private:
    template <typename T>
    Glob_Impl(In_Place_Tag, T&&) noexcept;

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;

    friend Glob;
};

/// @brief A compiled glob pattern, like `include/**/*.hpp`,
/// which is matched against paths relative to a source directory.
/// Matching is thread-safe.
struct Glob {
private:
    Glob_Impl m_impl;
    std::u8string m_pattern;

    [[nodiscard]]
    Glob(Glob_Impl&& impl, std::u8string_view pattern);

public:
    [[nodiscard]]
    static Result<Glob, Glob_Error_Code> make(std::u8string_view pattern);

    /// @brief Returns `true` if the whole of `path` matches the pattern.
    [[nodiscard]]
    bool matches(std::u8string_view path) const;

    [[nodiscard]]
    std::u8string_view pattern() const noexcept
    {
        return m_pattern;
    }
};

} // namespace lantern

#endif
