#ifndef LANTERN_RENDERER_HPP
#define LANTERN_RENDERER_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/fwd.hpp"

namespace lantern {

namespace template_id {

/// @brief The whole HTML document of a page.
inline constexpr std::u8string_view page = u8"page";
/// @brief The contents of the `<head>` element of a page.
inline constexpr std::u8string_view head = u8"head";
/// @brief The navigation sidebar, which is the same on every page.
inline constexpr std::u8string_view nav = u8"nav";

inline constexpr std::u8string_view all[] { page, head, nav };

} // namespace template_id

/// @brief A named value which is substituted for `{name}` in a template.
/// The value is inserted as is, so it has to be escaped already if it is meant to be text.
struct Template_Variable {
    std::u8string_view name;
    std::u8string_view value;
};

struct Render_Error {
    std::u8string message;
};

/// @brief Substitutes named fragments into templates.
struct Renderer {

    /// @brief Renders the template with the given id.
    /// Implementations shall be safe to call from multiple threads at once.
    /// @param template_id The template, like `template_id::page`.
    /// @param variables The fragments to substitute.
    /// @param memory The memory that the result is allocated with.
    [[nodiscard]]
    virtual Result<std::pmr::u8string, Render_Error> render(
        std::u8string_view template_id,
        std::span<const Template_Variable> variables,
        std::pmr::memory_resource* memory
    ) const
        = 0;
};

/// @brief Appends `text` to `out`, with every `{name}` replaced by the value of the variable
/// named `name`.
/// `{{` and `}}` stand for literal braces.
/// Fails if a placeholder names no variable or if a brace is unbalanced,
/// in which case `out` may have been partially appended to.
[[nodiscard]]
Result<void, Render_Error> format_template(
    std::pmr::u8string& out,
    std::u8string_view text,
    std::span<const Template_Variable> variables
);

/// @brief A `Renderer` whose templates are the built-in ones,
/// unless overridden by the `templates` of the configuration.
struct Template_Renderer final : Renderer {
private:
    struct Template {
        std::u8string_view id;
        std::u8string text;
    };

    std::vector<Template> m_templates;

public:
    /// @brief Constructs a renderer with the built-in templates.
    [[nodiscard]]
    Template_Renderer();

    /// @brief Constructs a renderer with the built-in templates,
    /// and replaces those named in `config.templates` with the contents of their files.
    [[nodiscard]]
    static Result<Template_Renderer, Config_Error> load(const Config& config);

    /// @brief Replaces the text of the template with the given id.
    /// Returns `false` if there is no such template.
    bool set_template(std::u8string_view id, std::u8string_view text);

    [[nodiscard]]
    Result<std::pmr::u8string, Render_Error> render(
        std::u8string_view template_id,
        std::span<const Template_Variable> variables,
        std::pmr::memory_resource* memory
    ) const final;
};

} // namespace lantern

#endif
