#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/assets.hpp"
#include "lantern/config.hpp"
#include "lantern/renderer.hpp"

namespace lantern {
namespace {

[[nodiscard]]
Render_Error make_render_error(std::u8string_view detail, std::u8string_view name)
{
    std::u8string message { detail };
    message += u8" \"";
    message += name;
    message += u8"\".";
    return Render_Error { std::move(message) };
}

} // namespace

Result<void, Render_Error> format_template(
    std::pmr::u8string& out,
    std::u8string_view text,
    std::span<const Template_Variable> variables
)
{
    while (!text.empty()) {
        const std::size_t brace = text.find_first_of(u8"{}");
        if (brace == std::u8string_view::npos) {
            out += text;
            break;
        }
        out += text.substr(0, brace);
        const char8_t c = text[brace];
        text.remove_prefix(brace + 1);

        if (text.starts_with(c)) {
            out += c;
            text.remove_prefix(1);
            continue;
        }
        if (c == u8'}') {
            return Render_Error { u8"Unbalanced \"}\" in template." };
        }

        const std::size_t close = text.find(u8'}');
        if (close == std::u8string_view::npos) {
            return Render_Error { u8"Unbalanced \"{\" in template." };
        }
        const std::u8string_view name = text.substr(0, close);
        text.remove_prefix(close + 1);

        const auto it = std::ranges::find(variables, name, &Template_Variable::name);
        if (it == variables.end()) {
            return make_render_error(u8"Template refers to unknown variable", name);
        }
        out += it->value;
    }
    return {};
}

Template_Renderer::Template_Renderer()
    : m_templates {
        { template_id::page, std::u8string { assets::page_html } },
        { template_id::head, std::u8string { assets::head_html } },
        { template_id::nav, std::u8string { assets::nav_html } },
    }
{
}

Result<Template_Renderer, Config_Error> Template_Renderer::load(const Config& config)
{
    Template_Renderer result;
    std::pmr::unsynchronized_pool_resource memory;
    for (const Template_Override& custom : config.templates) {
        Result<std::pmr::vector<char8_t>, IO_Error_Code> text
            = load_utf8_file(custom.file, &memory);
        if (!text) {
            std::u8string message = custom.file.generic_u8string();
            message += u8": ";
            message += io_error_code_message(text.error());
            return Config_Error { Config_Error_Code::io_error, std::move(message) };
        }
        if (!result.set_template(custom.id, as_u8string_view(*text))) {
            std::u8string message { u8"\"templates\": unknown template \"" };
            message += custom.id;
            message += u8"\"";
            return Config_Error { Config_Error_Code::wrong_type, std::move(message) };
        }
    }
    return result;
}

bool Template_Renderer::set_template(std::u8string_view id, std::u8string_view text)
{
    const auto it = std::ranges::find(m_templates, id, &Template::id);
    if (it == m_templates.end()) {
        return false;
    }
    it->text = text;
    return true;
}

Result<std::pmr::u8string, Render_Error> Template_Renderer::render(
    std::u8string_view template_id,
    std::span<const Template_Variable> variables,
    std::pmr::memory_resource* memory
) const
{
    const auto it = std::ranges::find(m_templates, template_id, &Template::id);
    if (it == m_templates.end()) {
        return make_render_error(u8"Unknown template", template_id);
    }
    std::pmr::u8string result { memory };
    Result<void, Render_Error> formatted = format_template(result, it->text, variables);
    if (!formatted) {
        std::u8string message { u8"In template \"" };
        message += template_id;
        message += u8"\": ";
        message += formatted.error().message;
        return Render_Error { std::move(message) };
    }
    return result;
}

} // namespace lantern
