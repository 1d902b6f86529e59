#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "lantern/diagnostic.hpp"
#include "lantern/linker.hpp"
#include "lantern/symbol_graph.hpp"
#include "lantern/url_path.hpp"

#include "collecting_logger.hpp"
#include "entity_builders.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

[[nodiscard]]
Symbol make_symbol(Symbol_Kind kind, std::vector<std::u8string> name, Symbol_Kind parent_kind = Symbol_Kind::root)
{
    return Symbol { .kind = kind, .parent_kind = parent_kind, .qualified_name = std::move(name) };
}

[[nodiscard]]
Symbol in_file(Symbol symbol, std::u8string_view file)
{
    symbol.location = ast::Location { .file = std::u8string { file }, .begin = 0, .end = 0 };
    return symbol;
}

[[nodiscard]]
Linker_Options project_options()
{
    return Linker_Options {
        .output_url = {},
        .roots = {
            Source_Root {
                .name = u8"src",
                .dir = Url_Path::parse(u8"/home/user/project"),
                .strip_include_prefix = Url_Path::parse(u8"include"),
            },
        },
        .external_namespaces = { u8"std" },
        .external_url = u8"https://en.cppreference.com/w/cpp",
        .tree_url = u8"https://github.com/user/project/blob/main/{path}",
        .project_dir = Url_Path::parse(u8"/home/user/project"),
    };
}

TEST(Linker, rel_url)
{
    const Linker linker { Linker_Options {} };

    EXPECT_EQ(linker.rel_url(make_symbol(Symbol_Kind::class_, { u8"ns", u8"Foo" })).to_raw_string(), u8"class/ns/Foo");
    EXPECT_EQ(linker.rel_url(make_symbol(Symbol_Kind::struct_, { u8"S" })).to_raw_string(), u8"struct/S");
    EXPECT_EQ(linker.rel_url(make_symbol(Symbol_Kind::function, { u8"ns", u8"f" })).to_raw_string(), u8"function/ns/f");
    EXPECT_EQ(linker.rel_url(make_symbol(Symbol_Kind::namespace_, { u8"a", u8"b" })).to_raw_string(), u8"namespace/a/b");
    EXPECT_TRUE(linker.rel_url(Symbol {}).is_root());
}

TEST(Linker, members_are_anchors)
{
    const Linker linker { Linker_Options { .output_url = Url_Path::parse(u8"/docs") } };
    const Symbol method = make_symbol(Symbol_Kind::method, { u8"ns", u8"Foo", u8"get" }, Symbol_Kind::class_);

    EXPECT_EQ(linker.rel_url(method).to_raw_string(), u8"class/ns/Foo");
    EXPECT_EQ(linker.anchor(method), u8"get"sv);
    EXPECT_EQ(linker.href(method), u8"/docs/class/ns/Foo#get");

    const Symbol type = make_symbol(Symbol_Kind::class_, { u8"ns", u8"Foo" });
    EXPECT_EQ(linker.anchor(type), u8""sv);
    EXPECT_EQ(linker.href(type), u8"/docs/class/ns/Foo");
}

TEST(Linker, href_is_encoded)
{
    const Linker linker { Linker_Options {} };
    const Symbol op = make_symbol(Symbol_Kind::method, { u8"Foo", u8"operator<" }, Symbol_Kind::struct_);
    EXPECT_EQ(linker.href(op), u8"/struct/Foo#operator%3C");
}

TEST(Linker, external_symbols)
{
    const Linker linker { project_options() };
    const Symbol vector = in_file(
        make_symbol(Symbol_Kind::class_, { u8"std", u8"vector" }), u8"/usr/include/c++/14/vector"
    );

    EXPECT_TRUE(linker.is_external(vector));
    EXPECT_FALSE(linker.is_external(make_symbol(Symbol_Kind::class_, { u8"ns", u8"std" })));
    EXPECT_EQ(linker.abs_url(vector).to_string(), u8"https://en.cppreference.com/w/cpp/vector/vector");
    EXPECT_EQ(linker.href(vector), u8"https://en.cppreference.com/w/cpp/vector/vector");
    EXPECT_EQ(linker.source_url(vector), u8"https://en.cppreference.com/w/cpp/vector/vector");
}

TEST(Linker, header_path)
{
    const Linker linker { project_options() };

    EXPECT_EQ(linker.header_path(u8"/home/user/project/include/lib/x.hpp")->to_raw_string(), u8"lib/x.hpp");
    // The prefix is only stripped if it is present.
    EXPECT_EQ(linker.header_path(u8"/home/user/project/src/y.hpp")->to_raw_string(), u8"src/y.hpp");
    EXPECT_FALSE(linker.header_path(u8"/usr/include/stdio.h"));

    const Symbol unplaced = make_symbol(Symbol_Kind::class_, { u8"X" });
    EXPECT_FALSE(linker.header_path(unplaced));
}

TEST(Linker, root_of)
{
    const Linker linker { project_options() };
    const Source_Root* const root = linker.root_of(u8"/home/user/project/a.hpp");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, u8"src");
    EXPECT_EQ(linker.root_of(u8"/home/user/other/a.hpp"), nullptr);
}

TEST(Linker, source_url)
{
    const Linker linker { project_options() };
    EXPECT_EQ(
        linker.source_url(u8"/home/user/project/include/lib/x.hpp"),
        u8"https://github.com/user/project/blob/main/include/lib/x.hpp"
    );
    EXPECT_FALSE(linker.source_url(u8"/elsewhere/x.hpp"));

    Linker_Options appended = project_options();
    appended.tree_url = u8"https://example.com/tree";
    EXPECT_EQ(
        Linker { appended }.source_url(u8"/home/user/project/a b.hpp"), u8"https://example.com/tree/a%20b.hpp"
    );

    Linker_Options none = project_options();
    none.tree_url.clear();
    EXPECT_FALSE(Linker { none }.source_url(u8"/home/user/project/a.hpp"));
}

TEST(Linker, file_and_page_url)
{
    const Linker linker { Linker_Options { .output_url = Url_Path::parse(u8"/docs") } };
    const Url_Path file = linker.file_url(u8"src", Url_Path::parse(u8"lib/x.hpp"));
    EXPECT_EQ(file.to_raw_string(), u8"files/src/lib/x.hpp");
    EXPECT_EQ(linker.page_url(file).to_string(), u8"/docs/files/src/lib/x.hpp");
    EXPECT_EQ(linker.page_url(Url_Path {}).to_string(), u8"/docs");
}

TEST(Linker, resolve)
{
    using namespace lantern::test;

    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };

    const std::vector<ast::Entity> units { translation_unit({ namespace_(u8"ns", { class_(u8"Foo") }) }) };
    const Symbol_Graph graph = Symbol_Graph::build(units);
    const Linker linker { Linker_Options {} };

    const std::vector<std::u8string> present { u8"ns", u8"Foo" };
    const Symbol* const foo = linker.resolve(graph, present, logger);
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(foo->kind, Symbol_Kind::class_);
    EXPECT_TRUE(logger.nothing_logged());

    const std::vector<std::u8string> missing { u8"ns", u8"Bar" };
    EXPECT_EQ(linker.resolve(graph, missing, logger), nullptr);
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::link_unresolved);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_NE(logger.diagnostics[0].message.find(u8"ns::Bar"), std::u8string_view::npos);
}

} // namespace
} // namespace lantern
