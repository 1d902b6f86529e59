#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "lantern/util/url_encode.hpp"

#include "lantern/diagnostic.hpp"
#include "lantern/linker.hpp"
#include "lantern/services.hpp"
#include "lantern/symbol_graph.hpp"
#include "lantern/url_path.hpp"

namespace lantern {
namespace {

[[nodiscard]]
std::u8string_view category_of(Symbol_Kind kind)
{
    switch (kind) {
    case Symbol_Kind::namespace_: return u8"namespace";
    case Symbol_Kind::class_: return u8"class";
    case Symbol_Kind::struct_: return u8"struct";
    case Symbol_Kind::function: return u8"function";
    default: return u8"";
    }
}

[[nodiscard]]
Url_Path categorized_url(Symbol_Kind kind, std::span<const std::u8string> qualified_name)
{
    Url_Path result { category_of(kind) };
    return result.join(Url_Path { qualified_name });
}

struct Fragment_Appender {
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

} // namespace

Linker::Linker(Linker_Options options)
    : m_options { std::move(options) }
{
}

Url_Path Linker::rel_url(const Symbol& symbol) const
{
    if (symbol.kind == Symbol_Kind::root) {
        return {};
    }
    if (symbol.is_member()) {
        const std::span<const std::u8string> parent_name
            = std::span { symbol.qualified_name }.first(symbol.qualified_name.size() - 1);
        return categorized_url(symbol.parent_kind, parent_name);
    }
    return categorized_url(symbol.kind, symbol.qualified_name);
}

std::u8string_view Linker::anchor(const Symbol& symbol) const noexcept
{
    return symbol.is_member() ? symbol.name() : std::u8string_view {};
}

bool Linker::is_external(const Symbol& symbol) const noexcept
{
    if (symbol.qualified_name.empty()) {
        return false;
    }
    return std::ranges::contains(m_options.external_namespaces, symbol.qualified_name.front());
}

Url_Path Linker::abs_url(const Symbol& symbol) const
{
    return abs_url(symbol, m_options.output_url);
}

Url_Path Linker::abs_url(const Symbol& symbol, const Url_Path& base) const
{
    if (!is_external(symbol)) {
        return base.join(rel_url(symbol));
    }
    // The reference site documents entities at /<header>/<name>, like /vector/vector.
    Url_Path result = Url_Path::parse(m_options.external_url);
    if (symbol.location) {
        result.push_back(Url_Path::parse(symbol.location->file).file_name());
    }
    result.push_back(symbol.name());
    return result;
}

std::u8string Linker::href(const Symbol& symbol) const
{
    std::u8string result = abs_url(symbol).to_encoded_string();
    const std::u8string_view fragment = anchor(symbol);
    if (!fragment.empty() && !is_external(symbol)) {
        result += u8'#';
        Fragment_Appender appender { result };
        url_encode_ascii_if(appender, fragment, [](char8_t c) { return !is_url_unreserved(c); });
    }
    return result;
}

const Source_Root* Linker::root_of(std::u8string_view file) const noexcept
{
    const Url_Path path = Url_Path::parse(file);
    const auto it = std::ranges::find_if(m_options.roots, [&](const Source_Root& root) {
        return path.starts_with(root.dir);
    });
    return it == m_options.roots.end() ? nullptr : &*it;
}

std::optional<Url_Path> Linker::header_path(const Symbol& symbol) const
{
    if (!symbol.location) {
        return {};
    }
    return header_path(symbol.location->file);
}

std::optional<Url_Path> Linker::header_path(std::u8string_view file) const
{
    const Source_Root* const root = root_of(file);
    if (!root) {
        return {};
    }
    Url_Path result = Url_Path::parse(file).strip_prefix(root->dir);
    if (!root->strip_include_prefix.is_root() && result.starts_with(root->strip_include_prefix)) {
        result = result.strip_prefix(root->strip_include_prefix);
    }
    return result;
}

std::optional<std::u8string> Linker::source_url(const Symbol& symbol) const
{
    if (is_external(symbol)) {
        return abs_url(symbol).to_encoded_string();
    }
    if (!symbol.location) {
        return {};
    }
    return source_url(symbol.location->file);
}

std::optional<std::u8string> Linker::source_url(std::u8string_view file) const
{
    if (m_options.tree_url.empty()) {
        return {};
    }
    const Url_Path path = Url_Path::parse(file);
    if (!path.starts_with(m_options.project_dir)) {
        return {};
    }
    const std::u8string relative = path.strip_prefix(m_options.project_dir).to_encoded_raw_string();

    std::u8string result = m_options.tree_url;
    constexpr std::u8string_view placeholder = u8"{path}";
    if (const std::size_t pos = result.find(placeholder); pos != std::u8string::npos) {
        result.replace(pos, placeholder.size(), relative);
        return result;
    }
    if (!result.ends_with(u8'/')) {
        result += u8'/';
    }
    result += relative;
    return result;
}

Url_Path Linker::file_url(std::u8string_view root_name, const Url_Path& relative) const
{
    return Url_Path { u8"files", root_name }.join(relative);
}

Url_Path Linker::page_url(const Url_Path& relative) const
{
    return m_options.output_url.join(relative);
}

const Symbol* Linker::resolve(
    const Symbol_Graph& graph,
    std::span<const std::u8string> qualified_name,
    Logger& logger
) const
{
    if (const Symbol* const result = graph.find(qualified_name)) {
        return result;
    }
    if (logger.can_log(Severity::warning)) {
        std::u8string message = u8"Unable to resolve reference to \"";
        for (std::size_t i = 0; i < qualified_name.size(); ++i) {
            if (i != 0) {
                message += u8"::";
            }
            message += qualified_name[i];
        }
        message += u8"\". It is rendered as plain text.";
        logger.log(Severity::warning, diagnostic::link_unresolved, message);
    }
    return nullptr;
}

} // namespace lantern
