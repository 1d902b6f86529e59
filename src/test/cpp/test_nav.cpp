#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "lantern/util/html_writer.hpp"

#include "lantern/nav.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

struct Nav_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };

    [[nodiscard]]
    std::u8string_view write(const Nav_Item& item)
    {
        HTML_Writer writer { out };
        write_nav_html(writer, item);
        EXPECT_TRUE(writer.is_done());
        return out;
    }
};

TEST_F(Nav_Test, link)
{
    const Nav_Item item { Nav_Link { .name = u8"Foo", .href = u8"/class/Foo", .anchors = {} } };
    EXPECT_EQ(write(item), u8"<a href=/class/Foo>Foo</a>"sv);
}

TEST_F(Nav_Test, link_with_anchors)
{
    const Nav_Item item { Nav_Link {
        .name = u8"Foo",
        .href = u8"/class/Foo",
        .anchors = { Nav_Anchor { .title = u8"get", .href = u8"/class/Foo#get" } },
    } };
    EXPECT_EQ(
        write(item),
        u8"<a href=/class/Foo>Foo</a><div class=anchors><a href=/class/Foo#get>get</a></div>"sv
    );
}

TEST_F(Nav_Test, name_is_escaped)
{
    const Nav_Item item { Nav_Link { .name = u8"operator<", .href = u8"/a b", .anchors = {} } };
    EXPECT_EQ(write(item), u8"<a href=\"/a%20b\">operator&lt;</a>"sv);
}

TEST_F(Nav_Test, dir)
{
    Nav_Dir dir { .name = u8"ns", .items = {}, .open = false };
    dir.items.push_back(Nav_Item { Nav_Link { .name = u8"A", .href = u8"/a", .anchors = {} } });

    EXPECT_EQ(
        write(Nav_Item { dir }), u8"<details><summary>ns</summary><div><a href=/a>A</a></div></details>"sv
    );
}

TEST_F(Nav_Test, open_dir)
{
    const Nav_Item item { Nav_Dir { .name = u8"Basics", .items = {}, .open = true } };
    EXPECT_EQ(write(item), u8"<details open><summary>Basics</summary><div></div></details>"sv);
}

TEST_F(Nav_Test, named_root)
{
    Nav_Root root { .name = u8"API", .items = {} };
    root.items.push_back(Nav_Item { Nav_Dir { .name = u8"ns", .items = {}, .open = false } });

    EXPECT_EQ(
        write(Nav_Item { root }),
        u8"<details open class=root><summary>API</summary><div>"
        u8"<details><summary>ns</summary><div></div></details>"
        u8"</div></details>"sv
    );
}

TEST_F(Nav_Test, unnamed_root)
{
    Nav_Root root { .name = std::nullopt, .items = {} };
    root.items.push_back(Nav_Item { Nav_Link { .name = u8"Home", .href = u8"/", .anchors = {} } });

    EXPECT_EQ(write(Nav_Item { root }), u8"<div><a href=/>Home</a></div>"sv);
}

} // namespace
} // namespace lantern
