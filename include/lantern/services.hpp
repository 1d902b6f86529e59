#ifndef LANTERN_SERVICES_HPP
#define LANTERN_SERVICES_HPP

#include <memory_resource>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include "ulight/ulight.hpp"

#include "lantern/util/assert.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/typo.hpp"

#include "lantern/diagnostic.hpp"
#include "lantern/fwd.hpp"

namespace lantern {

using Highlight_Span = ulight::Token;
using ulight::Highlight_Type;

enum struct Syntax_Highlight_Error : Default_Underlying {
    unsupported_language,
    bad_code,
    other,
};

struct Syntax_Highlighter {

    /// @brief Returns a set of supported languages in no particular order.
    /// These languages can be used in `operator()` as hints.
    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_supported_languages() const
        = 0;

    /// @brief Matches `language` against the set of supported language of the syntax highlighter.
    ///
    // This member function is useful for typo detection.
    [[nodiscard]]
    virtual Distant<std::u8string_view>
    match_supported_language(std::u8string_view language, std::pmr::memory_resource* memory) const
        = 0;

    /// @brief Applies syntax highlighting to the given `code`.
    /// Spans of highlighted source code are appended to `out`.
    /// If a failed result is returned,
    /// nothing is appended to `out`.
    /// Implementations shall be safe to call from multiple threads at once.
    /// @param out Where the spans are appended to.
    /// @param code The source code.
    /// @param language A language hint.
    /// This should be one of the languages returned by `get_supported_languages`.
    /// @param memory Additional memory.
    [[nodiscard]]
    virtual Result<void, Syntax_Highlight_Error> operator()(
        std::pmr::vector<Highlight_Span>& out,
        std::u8string_view code,
        std::u8string_view language,
        std::pmr::memory_resource* memory
    ) const = 0;
};

/// @brief A `Syntax_Highlighter` that supports no languages.
struct No_Support_Syntax_Highlighter final : Syntax_Highlighter {

    [[nodiscard]]
    std::span<const std::u8string_view> get_supported_languages() const final
    {
        return {};
    }

    [[nodiscard]]
    Distant<std::u8string_view>
    match_supported_language(std::u8string_view, std::pmr::memory_resource*) const final
    {
        return {};
    }

    [[nodiscard]]
    Result<void, Syntax_Highlight_Error>
    operator()( //
        std::pmr::vector<Highlight_Span>&,
        std::u8string_view,
        std::u8string_view,
        std::pmr::memory_resource*
    ) const final
    {
        return Syntax_Highlight_Error::unsupported_language;
    }
};

inline constinit const No_Support_Syntax_Highlighter no_support_syntax_highlighter;

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        LANTERN_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Convenience function which logs a diagnostic if its severity is high enough.
    void log(
        Severity severity,
        std::u8string_view id,
        std::u8string_view message,
        Source_Location location = {}
    )
    {
        if (can_log(severity)) {
            (*this)(Diagnostic {
                .severity = severity,
                .id = id,
                .location = location,
                .message = message,
            });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

/// @brief A `Logger` which forwards to another logger,
/// but serializes all calls with a mutex.
/// Page generation tasks log through one of these,
/// so that a single-threaded logger can be shared between them.
struct Synchronized_Logger final : Logger {
private:
    Logger& m_target;
    std::mutex m_mutex;

public:
    [[nodiscard]]
    explicit Synchronized_Logger(Logger& target)
        : Logger { target.get_min_severity() }
        , m_target { target }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        const std::scoped_lock lock { m_mutex };
        m_target(diagnostic);
    }
};

} // namespace lantern

#endif
