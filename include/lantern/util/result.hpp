#ifndef LANTERN_RESULT_HPP
#define LANTERN_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "lantern/util/assert.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Holds either a value of type `T` or an error of type `E`.
/// A `Result` is implicitly constructible from either,
/// so that functions can simply `return value;` or `return error;`.
///
/// When `T` and `E` are not distinct, `success_tag` and `error_tag`
/// can be used to disambiguate construction.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>);

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
        : m_data { std::in_place_index<0> }
    {
    }

    template <typename U = T>
        requires std::is_constructible_v<T, U&&>
                     && (!std::is_same_v<std::remove_cvref_t<U>, Result>)
                     && (!std::is_same_v<std::remove_cvref_t<U>, E>)
                     && (!std::is_same_v<std::remove_cvref_t<U>, Success_Tag>)
                     && (!std::is_same_v<std::remove_cvref_t<U>, Error_Tag>)
    [[nodiscard]]
    constexpr Result(U&& value)
        : m_data { std::in_place_index<0>, std::forward<U>(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        requires(!std::is_same_v<T, E>)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        requires(!std::is_same_v<T, E>)
        : m_data { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_data { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_data { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        LANTERN_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }
    [[nodiscard]]
    constexpr const T& value() const&
    {
        LANTERN_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }
    [[nodiscard]]
    constexpr T&& value() &&
    {
        LANTERN_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        LANTERN_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }
    [[nodiscard]]
    constexpr const E& error() const&
    {
        LANTERN_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }
    [[nodiscard]]
    constexpr E&& error() &&
    {
        LANTERN_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_data));
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }
    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }
    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }
    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    template <typename U>
    [[nodiscard]]
    constexpr T value_or(U&& fallback) const&
    {
        return has_value() ? value() : T(std::forward<U>(fallback));
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_error { std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_error { std::in_place, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        LANTERN_ASSERT(m_error);
        return *m_error;
    }
    [[nodiscard]]
    constexpr const E& error() const&
    {
        LANTERN_ASSERT(m_error);
        return *m_error;
    }
    [[nodiscard]]
    constexpr E&& error() &&
    {
        LANTERN_ASSERT(m_error);
        return std::move(*m_error);
    }
};

} // namespace lantern

#endif
