#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "lantern/util/html_writer.hpp"

#include "lantern/autolink.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/doc_comment.hpp"
#include "lantern/doc_html.hpp"
#include "lantern/linker.hpp"
#include "lantern/services.hpp"
#include "lantern/symbol_graph.hpp"

#include "collecting_logger.hpp"
#include "entity_builders.hpp"

using namespace std::string_view_literals;

namespace lantern {
namespace {

using namespace lantern::test;

struct Doc_HTML_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Symbol_Graph graph;
    Linker linker { Linker_Options {} };
    std::pmr::u8string out { &memory };

    void SetUp() override
    {
        const std::vector<ast::Entity> units { translation_unit({ class_(u8"Foo") }) };
        graph = Symbol_Graph::build(units);
    }

    [[nodiscard]]
    std::u8string_view write(const Doc_Comment& comment)
    {
        const Autolinker autolinker { graph, linker };
        const Doc_HTML_Context context {
            .autolinker = autolinker,
            .highlighter = no_support_syntax_highlighter,
            .logger = logger,
            .memory = &memory,
        };
        HTML_Writer writer { out };
        write_doc_comment_html(writer, comment, context);
        EXPECT_TRUE(writer.is_done());
        return out;
    }

    [[nodiscard]]
    std::pmr::u8string text(std::u8string_view str)
    {
        return std::pmr::u8string { str, &memory };
    }

    [[nodiscard]]
    Doc_Param param(std::u8string_view name, std::u8string_view value)
    {
        return Doc_Param { .name = text(name), .text = text(value) };
    }
};

TEST_F(Doc_HTML_Test, empty)
{
    const Doc_Comment comment { &memory };
    EXPECT_EQ(write(comment), u8"<div class=description><p>No description provided.</p></div>"sv);
}

TEST_F(Doc_HTML_Test, description_params_returns)
{
    Doc_Comment comment { &memory };
    comment.description = text(u8"Uses Foo.");
    comment.params.push_back(param(u8"x", u8"The value"));
    comment.returns = text(u8"Doubled");

    EXPECT_EQ(
        write(comment),
        u8"<div class=description>"
        u8"<p>Uses <a href=/class/Foo>Foo</a>.</p>"
        u8"<section class=params><h3>Parameters</h3>"
        u8"<dl><dt><code>x</code></dt><dd>The value</dd></dl></section>"
        u8"<section class=\"params returns\"><h3>Returns</h3><div><p>Doubled</p></div></section>"
        u8"</div>"sv
    );
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Doc_HTML_Test, template_params_and_throws)
{
    Doc_Comment comment { &memory };
    comment.tparams.push_back(param(u8"T", u8"A Foo-like type"));
    comment.throws = text(u8"Nothing");

    EXPECT_EQ(
        write(comment),
        u8"<div class=description>"
        u8"<section class=\"params template\"><h3>Template parameters</h3>"
        u8"<dl><dt><code>T</code></dt><dd>A <a href=/class/Foo>Foo</a>-like type</dd></dl></section>"
        u8"<section class=\"params throws\"><h3>Throws</h3><div><p>Nothing</p></div></section>"
        u8"</div>"sv
    );
}

TEST_F(Doc_HTML_Test, version_and_since)
{
    Doc_Comment comment { &memory };
    comment.version = text(u8"2");
    comment.since = text(u8"1.0");

    EXPECT_EQ(
        write(comment),
        u8"<div class=description><div class=tags><p>Version 2</p><p>Since 1.0</p></div></div>"sv
    );
}

TEST_F(Doc_HTML_Test, see_notes_warnings)
{
    Doc_Comment comment { &memory };
    comment.see.push_back(text(u8"Foo"));
    comment.notes.push_back(text(u8"N"));
    comment.warnings.push_back(text(u8"W"));

    EXPECT_EQ(
        write(comment),
        u8"<div class=description>"
        u8"<section class=see><h3>See also</h3><ul><li><a href=/class/Foo>Foo</a></li></ul></section>"
        u8"<section class=note><h3>Note</h3><div><p>N</p></div></section>"
        u8"<section class=warning><h3>Warning</h3><div><p>W</p></div></section>"
        u8"</div>"sv
    );
}

TEST_F(Doc_HTML_Test, examples)
{
    Doc_Comment comment { &memory };
    comment.examples.push_back(Doc_Example { .code = text(u8"a < b"), .analyze = false });
    comment.examples.push_back(Doc_Example { .code = text(u8"f();"), .analyze = true });

    EXPECT_EQ(
        write(comment),
        u8"<div class=description>"
        u8"<section class=example><h3>Example</h3><pre><code class=language-cpp>a &lt; b</code></pre></section>"
        u8"<section class=example><h3>Example</h3><pre><code class=language-cpp>f();</code></pre></section>"
        u8"</div>"sv
    );
    // The analyzed example falls back to plain text since no language is supported.
    EXPECT_EQ(logger.count(diagnostic::highlight_language), 1);
}

} // namespace
} // namespace lantern
