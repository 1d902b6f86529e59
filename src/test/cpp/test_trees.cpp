#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"

#include "lantern/config.hpp"
#include "lantern/file_tree.hpp"
#include "lantern/glob.hpp"
#include "lantern/tutorial_tree.hpp"
#include "lantern/url_path.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

TEST(Markdown_Title, heading)
{
    const Markdown_Title result = extract_markdown_title(u8"Intro\n\n  # Getting started \nText");
    EXPECT_EQ(result.title, u8"Getting started"sv);
    EXPECT_EQ(result.body, u8"Intro\n\n  # Getting started \nText"sv);
}

TEST(Markdown_Title, front_matter)
{
    const Markdown_Title result
        = extract_markdown_title(u8"---\r\nauthor: me\r\ntitle: \"Setup\"\r\n---\r\n# Other\r\n");
    EXPECT_EQ(result.title, u8"Setup"sv);
    EXPECT_EQ(result.body, u8"# Other\r\n"sv);
}

TEST(Markdown_Title, front_matter_without_title)
{
    const Markdown_Title result = extract_markdown_title(u8"---\nauthor: me\n---\n# Heading\n");
    EXPECT_EQ(result.title, u8"Heading"sv);
    EXPECT_EQ(result.body, u8"# Heading\n"sv);
}

TEST(Markdown_Title, unterminated_front_matter)
{
    const Markdown_Title result = extract_markdown_title(u8"---\ntitle: x\n");
    EXPECT_EQ(result.title, u8""sv);
    EXPECT_EQ(result.body, u8"---\ntitle: x\n"sv);
}

TEST(Markdown_Title, none)
{
    const Markdown_Title result = extract_markdown_title(u8"#hashtag\n## Second level");
    EXPECT_TRUE(result.title.empty());
}

struct Tree_Test : testing::Test {
    std::filesystem::path dir;

    void SetUp() override
    {
        const testing::TestInfo* const info = testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / "lantern-test" / info->test_suite_name()
            / info->name();
        std::error_code error;
        std::filesystem::remove_all(dir, error);
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(dir, error);
    }

    void write(const std::filesystem::path& relative_path, std::u8string_view contents = u8"")
    {
        const std::filesystem::path path = dir / relative_path;
        ASSERT_TRUE(create_directories(path.parent_path()));
        ASSERT_TRUE(bytes_to_file(contents, path));
    }

    [[nodiscard]]
    static Glob glob(std::u8string_view pattern)
    {
        Result<Glob, Glob_Error_Code> result = Glob::make(pattern);
        EXPECT_TRUE(result);
        return std::move(*result);
    }
};

TEST_F(Tree_Test, load_tutorials)
{
    write("tutorials/index.md", u8"# Welcome\n\nHi.");
    write("tutorials/README.md", u8"# Not a tutorial");
    write("tutorials/setup.md", u8"---\ntitle: 'Getting started'\n---\nBody");
    write("tutorials/notes.txt", u8"# Not markdown");
    write("tutorials/basics/intro.md", u8"No heading.");
    write("tutorials/empty/picture.png");

    const Result<Tutorial_Folder, Config_Error> result
        = load_tutorials(Tutorials_Config { .dir = dir / "tutorials", .assets = {} });
    ASSERT_TRUE(result) << reinterpret_cast<const char*>(result.error().message.c_str());

    const Tutorial_Folder& root = *result;
    EXPECT_EQ(root.url, Url_Path { u8"tutorials" });
    EXPECT_EQ(root.depth, 0);
    // The index names its folder.
    EXPECT_EQ(root.title, u8"Welcome");
    ASSERT_TRUE(root.index);
    EXPECT_EQ(root.index->url, Url_Path { u8"tutorials" });
    EXPECT_EQ(root.index->markdown, u8"# Welcome\n\nHi.");

    // Folders come first, and empty folders are dropped.
    ASSERT_EQ(root.children.size(), 2);
    const auto* const basics = std::get_if<Tutorial_Folder>(&root.children[0].value);
    ASSERT_NE(basics, nullptr);
    EXPECT_EQ(basics->title, u8"basics");
    EXPECT_EQ(basics->depth, 1);
    EXPECT_TRUE(basics->is_open());
    EXPECT_FALSE(basics->index);
    ASSERT_EQ(basics->children.size(), 1);
    const auto* const intro = std::get_if<Tutorial>(&basics->children[0].value);
    ASSERT_NE(intro, nullptr);
    EXPECT_EQ(intro->title, u8"intro");
    EXPECT_EQ(intro->url, (Url_Path { u8"tutorials", u8"basics", u8"intro" }));

    const auto* const setup = std::get_if<Tutorial>(&root.children[1].value);
    ASSERT_NE(setup, nullptr);
    EXPECT_EQ(setup->title, u8"Getting started");
    EXPECT_EQ(setup->url, (Url_Path { u8"tutorials", u8"setup" }));
    EXPECT_EQ(setup->markdown, u8"Body");
    EXPECT_EQ(setup->file, dir / "tutorials/setup.md");
}

TEST_F(Tree_Test, load_tutorials_missing_dir)
{
    const Result<Tutorial_Folder, Config_Error> result
        = load_tutorials(Tutorials_Config { .dir = dir / "missing", .assets = {} });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Config_Error_Code::io_error);
}

TEST_F(Tree_Test, scan_sources)
{
    write("include/b.hpp");
    write("include/lib/a.hpp");
    write("include/lib/z.cpp");
    write("include/detail/x.hpp");

    std::vector<Source_Config> sources;
    sources.push_back(Source_Config {
        .name = u8"include",
        .dir = dir / "include",
        .include = {},
        .exclude = {},
        .strip_include_prefix = {},
    });
    sources.back().include.push_back(glob(u8"**/*.hpp"));
    sources.back().exclude.push_back(glob(u8"detail/**"));

    const Result<std::vector<File_Root>, Config_Error> result = scan_sources(sources);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->size(), 1);

    const File_Root& root = (*result)[0];
    EXPECT_EQ(root.name, u8"include");
    // Directories come first, and directories without documented files are absent.
    ASSERT_EQ(root.children.size(), 2);

    const File_Node& lib = root.children[0];
    EXPECT_TRUE(lib.is_directory);
    EXPECT_EQ(lib.name, u8"lib");
    EXPECT_EQ(lib.absolute_path, dir / "include/lib");
    ASSERT_EQ(lib.children.size(), 1);
    EXPECT_EQ(lib.children[0].name, u8"a.hpp");
    EXPECT_EQ(lib.children[0].relative_path, (Url_Path { u8"lib", u8"a.hpp" }));
    EXPECT_EQ(lib.children[0].absolute_path, dir / "include/lib/a.hpp");

    const File_Node& b = root.children[1];
    EXPECT_FALSE(b.is_directory);
    EXPECT_EQ(b.relative_path, Url_Path { u8"b.hpp" });
}

TEST_F(Tree_Test, scan_sources_missing_dir)
{
    std::vector<Source_Config> sources;
    sources.push_back(Source_Config {
        .name = u8"src",
        .dir = dir / "missing",
        .include = {},
        .exclude = {},
        .strip_include_prefix = {},
    });
    const Result<std::vector<File_Root>, Config_Error> result = scan_sources(sources);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Config_Error_Code::io_error);
}

} // namespace
} // namespace lantern
