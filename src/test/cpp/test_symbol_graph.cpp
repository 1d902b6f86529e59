#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "lantern/ast.hpp"
#include "lantern/symbol_graph.hpp"

#include "entity_builders.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

using namespace lantern::test;

[[nodiscard]]
const Symbol* find(const Symbol_Graph& graph, std::vector<std::u8string_view> name)
{
    return graph.find(std::span<const std::u8string_view> { name });
}

TEST(Symbol_Graph, empty)
{
    const Symbol_Graph graph = Symbol_Graph::build({});
    EXPECT_TRUE(graph.root().children.empty());
    EXPECT_EQ(graph.root().kind, Symbol_Kind::root);
    EXPECT_EQ(graph.root().display_name(), u8"<Global namespace>"sv);
}

TEST(Symbol_Graph, namespaces_are_merged)
{
    const std::vector<ast::Entity> units {
        translation_unit({ namespace_(u8"ns", { class_(u8"A") }) }),
        translation_unit({ namespace_(u8"ns", { class_(u8"B") }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    ASSERT_EQ(graph.root().children.size(), 1);
    const Symbol& ns = graph.root().children[0];
    EXPECT_EQ(ns.kind, Symbol_Kind::namespace_);
    ASSERT_EQ(ns.children.size(), 2);
    EXPECT_EQ(ns.children[0].name(), u8"A"sv);
    EXPECT_EQ(ns.children[1].name(), u8"B"sv);
    EXPECT_EQ(ns.children[1].qualified_name_string(), u8"ns::B");
}

TEST(Symbol_Graph, first_class_definition_wins)
{
    ast::Entity forward = class_(u8"A");
    forward.is_definition = false;

    const std::vector<ast::Entity> units {
        translation_unit({ forward }),
        translation_unit({ class_(u8"A", { field(u8"x", u8"int") }) }),
        translation_unit({ class_(u8"A", { field(u8"y", u8"int") }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    ASSERT_EQ(graph.root().children.size(), 1);
    const Symbol& a = graph.root().children[0];
    ASSERT_EQ(a.children.size(), 1);
    EXPECT_EQ(a.children[0].name(), u8"x"sv);
    EXPECT_EQ(a.children[0].parent_kind, Symbol_Kind::class_);
}

TEST(Symbol_Graph, functions_adopt_first_comment)
{
    const std::vector<ast::Entity> units {
        translation_unit({ function(u8"f") }),
        translation_unit({ with_comment(function(u8"f"), u8"/// Does f.") }),
        translation_unit({ with_comment(function(u8"f"), u8"/// Ignored.") }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    ASSERT_EQ(graph.root().children.size(), 1);
    const Symbol& f = graph.root().children[0];
    EXPECT_EQ(f.kind, Symbol_Kind::function);
    ASSERT_TRUE(f.raw_comment);
    EXPECT_EQ(*f.raw_comment, u8"/// Does f.");
}

TEST(Symbol_Graph, skips_undocumentable_entities)
{
    ast::Entity system = class_(u8"Sys");
    system.is_in_system_header = true;
    ast::Entity implicit = class_(u8"Implicit");
    implicit.is_implicit = true;

    const std::vector<ast::Entity> units {
        translation_unit({ system, implicit, namespace_(u8""), class_(u8"Kept") }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    ASSERT_EQ(graph.root().children.size(), 1);
    EXPECT_EQ(graph.root().children[0].name(), u8"Kept"sv);
}

TEST(Symbol_Graph, out_of_line_methods_are_ignored)
{
    const std::vector<ast::Entity> units {
        translation_unit({ class_(u8"A", { method(u8"run") }), method(u8"run") }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    ASSERT_EQ(graph.root().children.size(), 1);
    ASSERT_EQ(graph.root().children[0].children.size(), 1);
    EXPECT_EQ(graph.root().children[0].children[0].kind, Symbol_Kind::method);
}

TEST(Symbol_Graph, overloaded_methods_are_kept)
{
    ast::Entity by_int = method(u8"set");
    by_int.children.push_back(param(u8"x", u8"int"));
    ast::Entity by_float = method(u8"set");
    by_float.children.push_back(param(u8"x", u8"float"));

    const std::vector<ast::Entity> units {
        translation_unit({ class_(u8"A", { by_int, by_float }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol& a = graph.root().children[0];
    ASSERT_EQ(a.children.size(), 2);
    EXPECT_EQ(a.children[0].parameters[0].type, u8"int");
    EXPECT_EQ(a.children[1].parameters[0].type, u8"float");
}

TEST(Symbol_Graph, type_targets)
{
    ast::Entity widget = class_(u8"Widget");
    widget.id = u8"0x1";
    ast::Entity member = field(u8"child", u8"ui::Widget");
    member.referenced_id = u8"0x1";
    ast::Entity unknown = field(u8"other", u8"std::string");
    unknown.referenced_id = u8"0x2";

    const std::vector<ast::Entity> units {
        translation_unit({ namespace_(u8"ui", { widget, struct_(u8"Panel", { member, unknown }) }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol* const panel = find(graph, { u8"ui", u8"Panel" });
    ASSERT_NE(panel, nullptr);
    EXPECT_EQ(panel->kind, Symbol_Kind::struct_);
    ASSERT_EQ(panel->children.size(), 2);
    EXPECT_EQ(panel->children[0].type_target, (std::vector<std::u8string> { u8"ui", u8"Widget" }));
    EXPECT_TRUE(panel->children[1].type_target.empty());
}

TEST(Symbol_Graph, nested_records_are_skipped)
{
    ast::Entity inner = struct_(u8"Inner");
    inner.id = u8"0x2";
    ast::Entity next = field(u8"next", u8"Outer::Inner *");
    next.referenced_id = u8"0x2";

    const std::vector<ast::Entity> units {
        translation_unit({ namespace_(u8"ns", { class_(u8"Outer", { inner, method(u8"Run"), next }) }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol* const outer = find(graph, { u8"ns", u8"Outer" });
    ASSERT_NE(outer, nullptr);
    ASSERT_EQ(outer->children.size(), 2);
    EXPECT_EQ(outer->children[0].kind, Symbol_Kind::method);
    EXPECT_EQ(outer->children[1].kind, Symbol_Kind::field);
    // The type of a field cannot refer to a record without a page.
    EXPECT_TRUE(outer->children[1].type_target.empty());

    std::size_t records = 0;
    graph.for_each([&](const Symbol& symbol) {
        if (symbol.kind == Symbol_Kind::class_ || symbol.kind == Symbol_Kind::struct_) {
            ++records;
        }
    });
    EXPECT_EQ(records, 1);
}

TEST(Symbol_Graph, private_members_are_skipped)
{
    ast::Entity secret = method(u8"Secret");
    secret.access = Access_Specifier::private_;
    ast::Entity count = field(u8"count", u8"int");
    count.access = Access_Specifier::private_;
    ast::Entity hook = method(u8"Hook");
    hook.access = Access_Specifier::protected_;
    hook.is_static = true;

    const std::vector<ast::Entity> units {
        translation_unit({ class_(u8"A", { secret, count, hook, method(u8"Run") }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol& a = graph.root().children[0];
    ASSERT_EQ(a.children.size(), 2);
    EXPECT_EQ(a.children[0].name(), u8"Hook"sv);
    EXPECT_EQ(a.children[0].access, Access_Specifier::protected_);
    EXPECT_EQ(a.children[1].name(), u8"Run"sv);
}

TEST(Symbol_Graph, find)
{
    const std::vector<ast::Entity> units {
        translation_unit({ namespace_(u8"a", { namespace_(u8"b", { function(u8"f") }) }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol* const f = find(graph, { u8"a", u8"b", u8"f" });
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->qualified_name_string(), u8"a::b::f");
    EXPECT_EQ(find(graph, { u8"a", u8"c" }), nullptr);
    EXPECT_EQ(find(graph, {}), nullptr);
}

TEST(Symbol_Graph, select_is_depth_first)
{
    const std::vector<ast::Entity> units {
        translation_unit({
            namespace_(u8"a", { class_(u8"X"), function(u8"f") }),
            class_(u8"Y"),
        }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const std::vector<const Symbol*> all = graph.select([](const Symbol&) { return true; });
    ASSERT_EQ(all.size(), 4);
    EXPECT_EQ(all[0]->name(), u8"a"sv);
    EXPECT_EQ(all[1]->name(), u8"X"sv);
    EXPECT_EQ(all[2]->name(), u8"f"sv);
    EXPECT_EQ(all[3]->name(), u8"Y"sv);

    const std::vector<const Symbol*> classes
        = graph.select([](const Symbol& s) { return s.kind == Symbol_Kind::class_; });
    ASSERT_EQ(classes.size(), 2);
}

TEST(Symbol_Graph, method_signature)
{
    ast::Entity run = method(u8"run", u8"void");
    run.is_pure_virtual = true;
    run.is_const = true;
    run.children.push_back(param(u8"n", u8"int"));
    run.children.push_back(param(u8"", u8"float"));

    const std::vector<ast::Entity> units { translation_unit({ class_(u8"Task", { run }) }) };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol& symbol = graph.root().children[0].children[0];
    EXPECT_TRUE(symbol.is_virtual);
    EXPECT_EQ(symbol.signature(), u8"virtual void run(int n, float) const = 0");
}

TEST(Symbol_Graph, field_and_record_signature)
{
    ast::Entity count = field(u8"count", u8"int");
    count.is_static = true;

    const std::vector<ast::Entity> units {
        translation_unit({ namespace_(u8"ns", { struct_(u8"S", { count }) }) }),
    };
    const Symbol_Graph graph = Symbol_Graph::build(units);

    const Symbol* const s = find(graph, { u8"ns", u8"S" });
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->signature(), u8"struct ns::S");
    EXPECT_EQ(s->children[0].signature(), u8"static int count");
}

} // namespace
} // namespace lantern
