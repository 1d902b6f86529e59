#ifndef LANTERN_URL_PATH_HPP
#define LANTERN_URL_PATH_HPP

#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/fwd.hpp"

namespace lantern {

/// @brief A normalized path, used both for site URLs and for file system paths.
///
/// A path is an ordered sequence of segments,
/// optionally preceded by an origin such as `https://en.cppreference.com`.
/// Paths are normalized on construction:
/// - empty segments and `.` are dropped,
/// - `..` removes the previous segment, but never goes above the root, and
/// - segments containing `/` are split into multiple segments.
///
/// Consequently, `Url_Path::parse(p.to_string()) == p` for any `p`
/// whose segments were not special.
struct Url_Path {
private:
    std::u8string m_origin;
    std::vector<std::u8string> m_segments;

public:
    /// @brief Constructs the root path.
    [[nodiscard]]
    Url_Path() = default;

    [[nodiscard]]
    explicit Url_Path(std::span<const std::u8string_view> segments);

    [[nodiscard]]
    explicit Url_Path(std::span<const std::u8string> segments);

    [[nodiscard]]
    Url_Path(std::initializer_list<std::u8string_view> segments);

    /// @brief Parses a path of the form `/a/b`, `a/b/`, or `https://host/a/b`.
    /// Parsing never fails; malformed parts are normalized away.
    [[nodiscard]]
    static Url_Path parse(std::u8string_view str);

    [[nodiscard]]
    std::u8string_view origin() const noexcept
    {
        return m_origin;
    }

    [[nodiscard]]
    std::span<const std::u8string> segments() const noexcept
    {
        return m_segments;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_segments.size();
    }

    /// @brief Returns `true` if this is the root path of its origin.
    [[nodiscard]]
    bool is_root() const noexcept
    {
        return m_segments.empty();
    }

    /// @brief Appends a segment, applying the normalization rules.
    void push_back(std::u8string_view segment);

    /// @brief Removes the last segment, if any.
    void pop_back() noexcept;

    /// @brief Returns this path followed by the segments of `other`.
    /// If `other` has an origin, `other` is returned unchanged,
    /// since it is already absolute.
    [[nodiscard]]
    Url_Path join(const Url_Path& other) const;

    /// @brief Equivalent to `join(Url_Path::parse(relative))`.
    [[nodiscard]]
    Url_Path join(std::u8string_view relative) const;

    /// @brief Returns `true` if every segment of `prefix` matches the corresponding leading
    /// segment of this path, and the origins are equal.
    [[nodiscard]]
    bool starts_with(const Url_Path& prefix) const noexcept;

    /// @brief Removes `prefix` from the front of this path.
    /// If `prefix` is not actually a prefix,
    /// only the longest common leading sequence of segments is removed.
    /// The result never has an origin.
    [[nodiscard]]
    Url_Path strip_prefix(const Url_Path& prefix) const;

    /// @brief Returns the last segment, or an empty string for the root.
    [[nodiscard]]
    std::u8string_view file_name() const noexcept;

    /// @brief Returns the last segment without its extension,
    /// where the extension starts at the last `.` that is not the first character.
    [[nodiscard]]
    std::u8string_view file_stem() const noexcept;

    /// @brief Returns the path with the extension of the last segment removed.
    [[nodiscard]]
    Url_Path without_extension() const;

    /// @brief Returns the path without the last segment.
    [[nodiscard]]
    Url_Path parent() const;

    /// @brief Returns the display form, like `/a/b` or `https://host/a/b`.
    /// The root path is `/`.
    [[nodiscard]]
    std::u8string to_string() const;

    /// @brief Returns the segments joined with `/`, without leading slash or origin,
    /// like `a/b`.
    [[nodiscard]]
    std::u8string to_raw_string() const;

    /// @brief Like `to_string`, but with every segment percent-encoded,
    /// so that the result is safe both as a URL and as a relative file system path.
    [[nodiscard]]
    std::u8string to_encoded_string() const;

    /// @brief Like `to_raw_string`, but with every segment percent-encoded.
    [[nodiscard]]
    std::u8string to_encoded_raw_string() const;

    [[nodiscard]]
    friend bool operator==(const Url_Path&, const Url_Path&)
        = default;
};

} // namespace lantern

#endif
