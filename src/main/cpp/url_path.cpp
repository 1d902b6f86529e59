#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/url_encode.hpp"

#include "lantern/url_path.hpp"

namespace lantern {
namespace {

constexpr std::u8string_view origin_separator = u8"://";

struct Appender {
    std::u8string& out;

    void operator()(std::u8string_view str) const
    {
        out.append(str);
    }
    void operator()(char8_t c) const
    {
        out.push_back(c);
    }
};

void append_encoded_segment(std::u8string& out, std::u8string_view segment)
{
    Appender appender { out };
    url_encode_ascii_if(appender, segment, [](char8_t c) { return !is_url_unreserved(c); });
}

} // namespace

Url_Path::Url_Path(std::span<const std::u8string_view> segments)
{
    for (const std::u8string_view segment : segments) {
        push_back(segment);
    }
}

Url_Path::Url_Path(std::span<const std::u8string> segments)
{
    for (const std::u8string& segment : segments) {
        push_back(segment);
    }
}

Url_Path::Url_Path(std::initializer_list<std::u8string_view> segments)
    : Url_Path { std::span<const std::u8string_view> { segments.begin(), segments.size() } }
{
}

Url_Path Url_Path::parse(std::u8string_view str)
{
    Url_Path result;
    if (const std::size_t scheme_end = str.find(origin_separator);
        scheme_end != std::u8string_view::npos && str.substr(0, scheme_end).find(u8'/') == std::u8string_view::npos) {
        const std::size_t host_begin = scheme_end + origin_separator.size();
        const std::size_t host_end = std::min(str.find(u8'/', host_begin), str.size());
        result.m_origin = str.substr(0, host_end);
        str.remove_prefix(host_end);
    }
    result.push_back(str);
    return result;
}

void Url_Path::push_back(std::u8string_view segment)
{
    while (true) {
        const std::size_t slash = segment.find(u8'/');
        const std::u8string_view head = segment.substr(0, slash);

        if (head == u8"..") {
            pop_back();
        }
        else if (!head.empty() && head != u8".") {
            m_segments.emplace_back(head);
        }

        if (slash == std::u8string_view::npos) {
            break;
        }
        segment.remove_prefix(slash + 1);
    }
}

void Url_Path::pop_back() noexcept
{
    if (!m_segments.empty()) {
        m_segments.pop_back();
    }
}

Url_Path Url_Path::join(const Url_Path& other) const
{
    if (!other.m_origin.empty()) {
        return other;
    }
    Url_Path result = *this;
    for (const std::u8string& segment : other.m_segments) {
        result.m_segments.push_back(segment);
    }
    return result;
}

Url_Path Url_Path::join(std::u8string_view relative) const
{
    Url_Path result = *this;
    result.push_back(relative);
    return result;
}

bool Url_Path::starts_with(const Url_Path& prefix) const noexcept
{
    return m_origin == prefix.m_origin && prefix.m_segments.size() <= m_segments.size()
        && std::ranges::equal(prefix.m_segments, std::span { m_segments }.first(prefix.size()));
}

Url_Path Url_Path::strip_prefix(const Url_Path& prefix) const
{
    const auto [mismatch, _] = std::ranges::mismatch(m_segments, prefix.m_segments);
    Url_Path result;
    result.m_segments.assign(mismatch, m_segments.end());
    return result;
}

std::u8string_view Url_Path::file_name() const noexcept
{
    return m_segments.empty() ? std::u8string_view {} : std::u8string_view { m_segments.back() };
}

std::u8string_view Url_Path::file_stem() const noexcept
{
    const std::u8string_view name = file_name();
    const std::size_t dot = name.rfind(u8'.');
    return dot == std::u8string_view::npos || dot == 0 ? name : name.substr(0, dot);
}

Url_Path Url_Path::without_extension() const
{
    Url_Path result = *this;
    if (!result.m_segments.empty()) {
        const std::u8string_view stem = file_stem();
        result.m_segments.back().resize(stem.size());
    }
    return result;
}

Url_Path Url_Path::parent() const
{
    Url_Path result = *this;
    result.pop_back();
    return result;
}

std::u8string Url_Path::to_string() const
{
    std::u8string result = m_origin;
    for (const std::u8string& segment : m_segments) {
        result += u8'/';
        result += segment;
    }
    if (m_segments.empty()) {
        result += u8'/';
    }
    return result;
}

std::u8string Url_Path::to_raw_string() const
{
    std::u8string result;
    for (const std::u8string& segment : m_segments) {
        if (!result.empty()) {
            result += u8'/';
        }
        result += segment;
    }
    return result;
}

std::u8string Url_Path::to_encoded_string() const
{
    std::u8string result = m_origin;
    for (const std::u8string& segment : m_segments) {
        result += u8'/';
        append_encoded_segment(result, segment);
    }
    if (m_segments.empty()) {
        result += u8'/';
    }
    return result;
}

std::u8string Url_Path::to_encoded_raw_string() const
{
    std::u8string result;
    for (std::size_t i = 0; i < m_segments.size(); ++i) {
        if (i != 0) {
            result += u8'/';
        }
        append_encoded_segment(result, m_segments[i]);
    }
    return result;
}

} // namespace lantern
