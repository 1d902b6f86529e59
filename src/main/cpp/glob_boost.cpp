#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "lantern/glob.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace lantern {

static_assert(sizeof(Glob_Impl) == sizeof(boost::u32regex));

template <typename T>
Glob_Impl::Glob_Impl(In_Place_Tag, T&& arg) noexcept
{
    new (m_storage) boost::u32regex(std::forward<T>(arg));
}

auto& Glob_Impl::get()
{
    return *std::launder(reinterpret_cast<boost::u32regex*>(m_storage));
}

const auto& Glob_Impl::get() const
{
    return *std::launder(reinterpret_cast<const boost::u32regex*>(m_storage));
}

Glob_Impl::Glob_Impl() noexcept
{
    new (m_storage) boost::u32regex;
}

Glob_Impl::Glob_Impl(const Glob_Impl& other) noexcept
    : Glob_Impl { In_Place_Tag {}, other.get() }
{
}

Glob_Impl::Glob_Impl(Glob_Impl&& other) noexcept
    : Glob_Impl { In_Place_Tag {}, std::move(other.get()) }
{
}

// NOLINTNEXTLINE(bugprone-unhandled-self-assignment)
Glob_Impl& Glob_Impl::operator=(const Glob_Impl& other) noexcept
{
    get() = other.get();
    return *this;
}

Glob_Impl& Glob_Impl::operator=(Glob_Impl&& other) noexcept
{
    // NOLINTNEXTLINE(performance-move-const-arg)
    get() = std::move(other.get());
    return *this;
}

Glob_Impl::~Glob_Impl()
{
    get().~basic_regex();
}

std::u8string glob_to_regex(std::u8string_view glob)
{
    constexpr std::u8string_view regex_special = u8".^$|()[]{}+\\";

    std::u8string result;
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char8_t c = glob[i];
        if (c == u8'*') {
            if (i + 1 < glob.size() && glob[i + 1] == u8'*') {
                ++i;
                if (i + 1 < glob.size() && glob[i + 1] == u8'/') {
                    ++i;
                    result += u8"(?:.*/)?";
                }
                else {
                    result += u8".*";
                }
            }
            else {
                result += u8"[^/]*";
            }
        }
        else if (c == u8'?') {
            result += u8"[^/]";
        }
        else {
            if (regex_special.contains(c)) {
                result += u8'\\';
            }
            result += c;
        }
    }
    return result;
}

Glob::Glob(Glob_Impl&& impl, std::u8string_view pattern)
    : m_impl { std::move(impl) }
    , m_pattern { pattern }
{
}

Result<Glob, Glob_Error_Code> Glob::make(std::u8string_view pattern)
{
    constexpr auto flags = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;

    const std::u8string regex = glob_to_regex(pattern);
    boost::u32regex compiled = boost::make_u32regex(regex.data(), regex.data() + regex.size(), flags);
    if (compiled.status() != 0) {
        return Glob_Error_Code::bad_pattern;
    }
    return Glob { Glob_Impl { In_Place_Tag {}, std::move(compiled) }, pattern };
}

bool Glob::matches(std::u8string_view path) const
{
    return boost::u32regex_match(path.data(), path.data() + path.size(), m_impl.get());
}

} // namespace lantern
