#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/renderer.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

constexpr Template_Variable variables[] {
    { u8"name", u8"World" },
    { u8"punctuation", u8"!" },
    { u8"empty", u8"" },
};

[[nodiscard]]
Result<void, Render_Error> format(std::pmr::u8string& out, std::u8string_view text)
{
    return format_template(out, text, variables);
}

TEST(Format_Template, substitutes_variables)
{
    std::pmr::u8string out;
    ASSERT_TRUE(format(out, u8"Hello, {name}{punctuation}{empty}"));
    EXPECT_EQ(out, u8"Hello, World!"sv);
}

TEST(Format_Template, appends)
{
    std::pmr::u8string out = u8"> ";
    ASSERT_TRUE(format(out, u8"{name}"));
    EXPECT_EQ(out, u8"> World"sv);
}

TEST(Format_Template, escaped_braces)
{
    std::pmr::u8string out;
    ASSERT_TRUE(format(out, u8"{{name}} is {name}, p {{ margin: 0 }}"));
    EXPECT_EQ(out, u8"{name} is World, p { margin: 0 }"sv);
}

TEST(Format_Template, no_placeholders)
{
    std::pmr::u8string out;
    ASSERT_TRUE(format(out, u8"<p>plain</p>"));
    EXPECT_EQ(out, u8"<p>plain</p>"sv);
    ASSERT_TRUE(format(out, u8""));
    EXPECT_EQ(out, u8"<p>plain</p>"sv);
}

TEST(Format_Template, unknown_variable)
{
    std::pmr::u8string out;
    const Result<void, Render_Error> result = format(out, u8"{nobody}");
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find(u8"\"nobody\""), std::u8string::npos);
}

TEST(Format_Template, unbalanced)
{
    std::pmr::u8string out;
    EXPECT_FALSE(format(out, u8"{name"));
    EXPECT_FALSE(format(out, u8"name}"));
    EXPECT_FALSE(format(out, u8"}"));
    EXPECT_FALSE(format(out, u8"{"));
}

TEST(Template_Renderer, override)
{
    std::pmr::monotonic_buffer_resource memory;
    Template_Renderer renderer;
    ASSERT_TRUE(renderer.set_template(template_id::head, u8"<title>{name}</title>"));

    const Result<std::pmr::u8string, Render_Error> result
        = renderer.render(template_id::head, variables, &memory);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, u8"<title>World</title>"sv);
}

TEST(Template_Renderer, unknown_template)
{
    std::pmr::monotonic_buffer_resource memory;
    Template_Renderer renderer;
    EXPECT_FALSE(renderer.set_template(u8"footer", u8"x"));
    EXPECT_FALSE(renderer.render(u8"footer", variables, &memory));
}

TEST(Template_Renderer, error_names_template)
{
    std::pmr::monotonic_buffer_resource memory;
    Template_Renderer renderer;
    ASSERT_TRUE(renderer.set_template(template_id::nav, u8"{missing}"));

    const Result<std::pmr::u8string, Render_Error> result
        = renderer.render(template_id::nav, variables, &memory);
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().message.starts_with(u8"In template \"nav\": "));
}

TEST(Template_Renderer, load_without_overrides)
{
    const Result<Template_Renderer, Config_Error> renderer = Template_Renderer::load(Config {});
    EXPECT_TRUE(renderer);
}

TEST(Template_Renderer, load_missing_file)
{
    Config config;
    config.templates.push_back({ .id = u8"page", .file = "/nonexistent/lantern/page.html" });

    const Result<Template_Renderer, Config_Error> renderer = Template_Renderer::load(config);
    ASSERT_FALSE(renderer);
    EXPECT_EQ(renderer.error().code, Config_Error_Code::io_error);
}

} // namespace
} // namespace lantern
