#include <cstddef>
#include <filesystem>
#include <future>
#include <memory_resource>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/build_context.hpp"
#include "lantern/builder.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/linker.hpp"
#include "lantern/renderer.hpp"
#include "lantern/services.hpp"
#include "lantern/symbol_graph.hpp"

#include "collecting_logger.hpp"
#include "entity_builders.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

using namespace lantern::test;

[[nodiscard]]
Page_Task ready(Page_Result result)
{
    std::promise<Page_Result> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

[[nodiscard]]
Page_Task succeeded(std::u8string_view url)
{
    return ready(Url_Path::parse(url));
}

[[nodiscard]]
Page_Task failed(std::u8string_view url, std::u8string_view cause)
{
    return ready(Build_Error { .url = std::u8string { url }, .cause = std::u8string { cause } });
}

struct Join_Test : testing::Test {
    std::pmr::synchronized_pool_resource memory;
    Collecting_Logger logger { &memory };
    std::vector<std::u8string> messages;
};

TEST_F(Join_Test, empty)
{
    const Result<std::size_t, Build_Error> result = join_tasks({}, logger);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 0);
}

TEST_F(Join_Test, counts_pages)
{
    const std::vector<Page_Task> tasks { succeeded(u8""), succeeded(u8"class/Foo") };
    const auto progress = [&](std::u8string_view message) { messages.emplace_back(message); };

    const Result<std::size_t, Build_Error> result = join_tasks(tasks, logger, progress);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 2);
    EXPECT_EQ(messages, (std::vector<std::u8string> { u8"Built /", u8"Built /class/Foo" }));
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Join_Test, first_failure_wins)
{
    const std::vector<Page_Task> tasks {
        succeeded(u8"a"),
        failed(u8"/b", u8"first"),
        succeeded(u8"c"),
        failed(u8"/d", u8"second"),
    };
    const auto progress = [&](std::u8string_view message) { messages.emplace_back(message); };

    const Result<std::size_t, Build_Error> result = join_tasks(tasks, logger, progress);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().url, u8"/b");
    EXPECT_EQ(result.error().cause, u8"first");
    // Successful tasks after the failure are still awaited and reported.
    EXPECT_EQ(messages, (std::vector<std::u8string> { u8"Built /a", u8"Built /c" }));
}

TEST_F(Join_Test, progress_failure_is_logged)
{
    const std::vector<Page_Task> tasks { succeeded(u8"a"), succeeded(u8"b") };
    const auto progress = [](std::u8string_view) { throw std::runtime_error("closed"); };

    const Result<std::size_t, Build_Error> result = join_tasks(tasks, logger, progress);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 2);
    EXPECT_EQ(logger.count(diagnostic::build_progress_failed), 2);
}

struct Builder_Test : testing::Test {
    std::pmr::synchronized_pool_resource memory;
    Collecting_Logger logger { &memory };
    Template_Renderer renderer;
    std::filesystem::path output_dir;

    void SetUp() override
    {
        const testing::TestInfo* const info = testing::UnitTest::GetInstance()->current_test_info();
        output_dir = std::filesystem::temp_directory_path() / "lantern-test" / info->name();
        std::error_code error;
        std::filesystem::remove_all(output_dir, error);
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(output_dir, error);
    }

    [[nodiscard]]
    Build_Context make_context()
    {
        const std::vector<ast::Entity> units {
            translation_unit({
                namespace_(u8"ns", { with_comment(class_(u8"Foo", { method(u8"get") }), u8"/// A foo.") }),
                with_comment(function(u8"bar"), u8"/// Does bar."),
            }),
        };
        Config config;
        config.project.name = u8"Proj";
        config.project.version = u8"1.0";
        return Build_Context {
            .config = std::move(config),
            .graph = Symbol_Graph::build(units),
            .linker = Linker { Linker_Options {} },
            .files = {},
            .tutorials = {},
            .renderer = renderer,
            .highlighter = no_support_syntax_highlighter,
            .logger = logger,
            .output_dir = output_dir,
        };
    }

    [[nodiscard]]
    std::u8string read(const std::filesystem::path& relative_path)
    {
        const Result<std::pmr::vector<char8_t>, IO_Error_Code> text
            = load_utf8_file(output_dir / relative_path, &memory);
        EXPECT_TRUE(text) << relative_path;
        if (!text) {
            return {};
        }
        return std::u8string { as_u8string_view(*text) };
    }
};

TEST_F(Builder_Test, build_writes_every_page)
{
    Builder builder { make_context(), 2 };
    std::vector<std::u8string> messages;
    const auto progress = [&](std::u8string_view message) { messages.emplace_back(message); };

    const Result<std::size_t, Build_Error> result = builder.build(progress);
    ASSERT_TRUE(result) << reinterpret_cast<const char*>(result.error().cause.c_str());
    EXPECT_EQ(*result, 4);
    EXPECT_TRUE(builder.is_set_up());
    EXPECT_EQ(
        messages,
        (std::vector<std::u8string> {
            u8"Built /",
            u8"Built /namespace/ns",
            u8"Built /class/ns/Foo",
            u8"Built /function/bar",
        })
    );

    EXPECT_TRUE(std::filesystem::is_regular_file(output_dir / "main.css"));
    for (const char* page : { "", "namespace/ns", "class/ns/Foo", "function/bar" }) {
        const std::filesystem::path directory = output_dir / page;
        EXPECT_TRUE(std::filesystem::is_regular_file(directory / "index.html")) << page;
        EXPECT_TRUE(std::filesystem::is_regular_file(directory / "content.html")) << page;
        EXPECT_TRUE(std::filesystem::is_regular_file(directory / "metadata.json")) << page;
    }
}

TEST_F(Builder_Test, page_contents)
{
    Builder builder { make_context(), 1 };
    const Result<std::size_t, Build_Error> result = builder.build();
    ASSERT_TRUE(result);

    EXPECT_EQ(
        read("class/ns/Foo/metadata.json"),
        u8R"({"title":"Foo Docs in Proj","description":"Documentation for the Foo class in Proj"})"
    );

    const std::u8string content = read("class/ns/Foo/content.html");
    EXPECT_NE(content.find(u8"A foo."), std::u8string::npos);

    const std::u8string page = read("class/ns/Foo/index.html");
    EXPECT_TRUE(page.starts_with(u8"<!DOCTYPE html>"));
    EXPECT_NE(page.find(content), std::u8string::npos);
    EXPECT_NE(page.find(u8"<title>Foo Docs in Proj</title>"), std::u8string::npos);
    // Every page carries the same navigation.
    const std::u8string& nav = builder.context().nav_html;
    EXPECT_FALSE(nav.empty());
    EXPECT_NE(nav.find(u8"href=/class/ns/Foo"), std::u8string::npos);
    EXPECT_NE(page.find(nav), std::u8string::npos);
    EXPECT_NE(read("index.html").find(nav), std::u8string::npos);
}

TEST_F(Builder_Test, spawn_single_page)
{
    Builder builder { make_context(), 1 };
    ASSERT_TRUE(builder.setup());

    const Symbol* const foo = builder.context().graph.find(std::vector { u8"ns"sv, u8"Foo"sv });
    ASSERT_NE(foo, nullptr);
    const Page_Task task = builder.spawn(Entry { Record_Entry { foo } });
    const Page_Result& result = task.get();
    ASSERT_TRUE(result);
    EXPECT_EQ(result->to_string(), u8"/class/ns/Foo");
    EXPECT_TRUE(std::filesystem::is_regular_file(output_dir / "class/ns/Foo/index.html"));
    EXPECT_FALSE(std::filesystem::exists(output_dir / "function/bar"));
}

TEST_F(Builder_Test, page_failure_names_the_page)
{
    ASSERT_TRUE(renderer.set_template(template_id::page, u8"{missing}"));
    Builder builder { make_context(), 2 };

    const Result<std::size_t, Build_Error> result = builder.build();
    ASSERT_FALSE(result);
    // The index page is the first task, so its failure is the one reported.
    EXPECT_EQ(result.error().url, u8"/");
    EXPECT_EQ(
        result.error().cause,
        u8"In template \"page\": Template refers to unknown variable \"missing\"."
    );
}

TEST_F(Builder_Test, nav_failure_fails_setup)
{
    ASSERT_TRUE(renderer.set_template(template_id::nav, u8"{"));
    Builder builder { make_context(), 1 };

    const Result<void, Build_Error> result = builder.setup();
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().url.empty());
    EXPECT_EQ(result.error().cause, u8"In template \"nav\": Unbalanced \"{\" in template.");
    EXPECT_FALSE(builder.is_set_up());
}

} // namespace
} // namespace lantern
