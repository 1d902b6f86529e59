#include <filesystem>
#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/glob.hpp"
#include "lantern/linker.hpp"

#include "collecting_logger.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

struct Config_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    const std::filesystem::path input_dir { "/home/user/project" };

    [[nodiscard]]
    Result<Config, Config_Error> parse(std::u8string_view source)
    {
        return parse_config(source, input_dir, logger, &memory);
    }
};

TEST(Glob, to_regex)
{
    EXPECT_EQ(glob_to_regex(u8"*.hpp"), u8"[^/]*\\.hpp");
    EXPECT_EQ(glob_to_regex(u8"**/x?"), u8"(?:.*/)?x[^/]");
    EXPECT_EQ(glob_to_regex(u8"a/**"), u8"a/.*");
}

TEST(Glob, matches)
{
    const Result<Glob, Glob_Error_Code> headers = Glob::make(u8"**/*.hpp");
    ASSERT_TRUE(headers);
    EXPECT_EQ(headers->pattern(), u8"**/*.hpp"sv);
    EXPECT_TRUE(headers->matches(u8"x.hpp"));
    EXPECT_TRUE(headers->matches(u8"lib/detail/x.hpp"));
    EXPECT_FALSE(headers->matches(u8"x.cpp"));
    EXPECT_FALSE(headers->matches(u8"x.hpp.in"));

    const Result<Glob, Glob_Error_Code> flat = Glob::make(u8"*.hpp");
    ASSERT_TRUE(flat);
    EXPECT_TRUE(flat->matches(u8"x.hpp"));
    EXPECT_FALSE(flat->matches(u8"lib/x.hpp"));
}

TEST_F(Config_Test, minimal)
{
    const Result<Config, Config_Error> config = parse(u8R"({
        "project": { "name": "Widgets", "version": "1.2" },
        "sources": [ { "name": "include", "dir": "include" } ]
    })");
    ASSERT_TRUE(config);

    EXPECT_EQ(config->project.name, u8"Widgets");
    EXPECT_EQ(config->project.version, u8"1.2");
    EXPECT_TRUE(config->project.repository.empty());
    ASSERT_EQ(config->sources.size(), 1);
    EXPECT_EQ(config->sources[0].dir, std::filesystem::path { "/home/user/project/include" });
    EXPECT_TRUE(config->sources[0].is_included(u8"lib/x.hpp"));
    EXPECT_FALSE(config->tutorials);
    EXPECT_TRUE(config->output_url.empty());
    ASSERT_EQ(config->external_namespaces.size(), 1);
    EXPECT_EQ(config->external_namespaces[0], u8"std");
    EXPECT_EQ(config->external_url, default_external_url);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Config_Test, full)
{
    const Result<Config, Config_Error> config = parse(u8R"({
        "project": {
            "name": "Widgets",
            "version": "1.2",
            "repository": "https://github.com/user/widgets",
            "tree": "https://github.com/user/widgets/blob/main/{path}",
            "icon": "icon.png"
        },
        "sources": [
            {
                "name": "src",
                "dir": ".",
                "include": ["include/**/*.hpp"],
                "exclude": ["**/detail/**"],
                "strip-include-prefix": "include"
            }
        ],
        "tutorials": { "dir": "docs", "assets": ["docs/img"] },
        "output-url": "/widgets",
        "external": { "namespaces": ["std", "boost"], "url": "https://example.com/ref" },
        "templates": { "page": "theme/page.html" }
    })");
    ASSERT_TRUE(config);

    EXPECT_EQ(config->project.tree, u8"https://github.com/user/widgets/blob/main/{path}");
    const Source_Config& source = config->sources[0];
    EXPECT_EQ(source.strip_include_prefix, u8"include");
    EXPECT_TRUE(source.is_included(u8"include/lib/x.hpp"));
    EXPECT_FALSE(source.is_included(u8"include/lib/detail/y.hpp"));
    EXPECT_FALSE(source.is_included(u8"src/x.hpp"));

    ASSERT_TRUE(config->tutorials);
    EXPECT_EQ(config->tutorials->dir, std::filesystem::path { "/home/user/project/docs" });
    ASSERT_EQ(config->tutorials->assets.size(), 1);
    EXPECT_EQ(config->tutorials->assets[0], std::filesystem::path { "/home/user/project/docs/img" });

    EXPECT_EQ(config->output_url, u8"/widgets");
    EXPECT_EQ(config->external_namespaces.size(), 2);
    EXPECT_EQ(config->external_url, u8"https://example.com/ref");
    ASSERT_EQ(config->templates.size(), 1);
    EXPECT_EQ(config->templates[0].id, u8"page");
    EXPECT_EQ(config->templates[0].file, std::filesystem::path { "/home/user/project/theme/page.html" });
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Config_Test, unknown_keys_are_warned)
{
    const Result<Config, Config_Error> config = parse(u8R"({
        "project": { "name": "W", "version": "1", "colour": "red" },
        "sources": [],
        "theme": "dark"
    })");
    ASSERT_TRUE(config);
    EXPECT_EQ(logger.count(diagnostic::config_key_unknown), 2);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::soft_warning);
}

TEST_F(Config_Test, malformed)
{
    const Result<Config, Config_Error> config = parse(u8"{ \"project\": ");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, Config_Error_Code::malformed);

    const Result<Config, Config_Error> array = parse(u8"[]");
    ASSERT_FALSE(array);
    EXPECT_EQ(array.error().code, Config_Error_Code::malformed);
}

TEST_F(Config_Test, missing_project)
{
    const Result<Config, Config_Error> config = parse(u8R"({ "sources": [] })");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, Config_Error_Code::missing_key);
}

TEST_F(Config_Test, missing_version)
{
    const Result<Config, Config_Error> config = parse(u8R"({ "project": { "name": "W" }, "sources": [] })");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, Config_Error_Code::missing_key);
    EXPECT_NE(config.error().message.find(u8"version"), std::u8string::npos);
}

TEST_F(Config_Test, wrong_type)
{
    const Result<Config, Config_Error> name = parse(u8R"({ "project": { "name": 5, "version": "1" }, "sources": [] })");
    ASSERT_FALSE(name);
    EXPECT_EQ(name.error().code, Config_Error_Code::wrong_type);

    const Result<Config, Config_Error> sources
        = parse(u8R"({ "project": { "name": "W", "version": "1" }, "sources": {} })");
    ASSERT_FALSE(sources);
    EXPECT_EQ(sources.error().code, Config_Error_Code::wrong_type);

    const Result<Config, Config_Error> include = parse(u8R"({
        "project": { "name": "W", "version": "1" },
        "sources": [ { "name": "s", "dir": ".", "include": [1] } ]
    })");
    ASSERT_FALSE(include);
    EXPECT_EQ(include.error().code, Config_Error_Code::wrong_type);
}

TEST_F(Config_Test, load_missing_file)
{
    const Result<Config, Config_Error> config
        = load_config(std::filesystem::path { "/nonexistent/lantern/project" }, logger, &memory);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, Config_Error_Code::io_error);
}

TEST_F(Config_Test, linker_options)
{
    const Result<Config, Config_Error> config = parse(u8R"({
        "project": { "name": "W", "version": "1", "tree": "https://example.com/{path}" },
        "sources": [ { "name": "src", "dir": ".", "strip-include-prefix": "include" } ],
        "output-url": "/docs/"
    })");
    ASSERT_TRUE(config);

    const Linker_Options options = make_linker_options(*config);
    EXPECT_EQ(options.output_url.to_string(), u8"/docs");
    ASSERT_EQ(options.roots.size(), 1);
    EXPECT_EQ(options.roots[0].name, u8"src");
    EXPECT_EQ(options.roots[0].dir.to_string(), u8"/home/user/project");
    EXPECT_EQ(options.roots[0].strip_include_prefix.to_raw_string(), u8"include");
    EXPECT_EQ(options.project_dir.to_string(), u8"/home/user/project");
    EXPECT_EQ(options.tree_url, u8"https://example.com/{path}");
}

} // namespace
} // namespace lantern
