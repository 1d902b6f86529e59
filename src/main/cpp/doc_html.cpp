#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "lantern/util/html_writer.hpp"

#include "lantern/autolink.hpp"
#include "lantern/doc_comment.hpp"
#include "lantern/doc_html.hpp"
#include "lantern/highlighting.hpp"
#include "lantern/markdown.hpp"

namespace lantern {
namespace {

void open_section(HTML_Writer& out, std::u8string_view css_class, std::u8string_view heading)
{
    out.open_tag_with_attributes(u8"section").write_class(css_class).end();
    out.write_element(u8"h3", heading);
}

void write_params_section(
    HTML_Writer& out,
    std::span<const Doc_Param> params,
    std::u8string_view css_class,
    std::u8string_view heading,
    const Doc_HTML_Context& context
)
{
    if (params.empty()) {
        return;
    }
    open_section(out, css_class, heading);
    out.open_tag(u8"dl");
    for (const Doc_Param& param : params) {
        out.open_tag(u8"dt");
        out.write_element(u8"code", param.name);
        out.close_tag(u8"dt");
        out.open_tag(u8"dd");
        write_doc_inline_html(out, param.text, context);
        out.close_tag(u8"dd");
    }
    out.close_tag(u8"dl");
    out.close_tag(u8"section");
}

void write_text_section(
    HTML_Writer& out,
    std::u8string_view text,
    std::u8string_view css_class,
    std::u8string_view heading,
    const Doc_HTML_Context& context
)
{
    open_section(out, css_class, heading);
    out.open_tag(u8"div");
    write_doc_text_html(out, text, context);
    out.close_tag(u8"div");
    out.close_tag(u8"section");
}

void write_example(HTML_Writer& out, const Doc_Example& example, const Doc_HTML_Context& context)
{
    open_section(out, u8"example", u8"Example");
    out.open_tag(u8"pre");
    out.open_tag_with_attributes(u8"code").write_class(u8"language-cpp").end();
    if (example.analyze) {
        write_code(out, example.code, u8"cpp", context.highlighter, context.logger, context.memory);
    }
    else {
        out.write_inner_text(example.code);
    }
    out.close_tag(u8"code");
    out.close_tag(u8"pre");
    out.close_tag(u8"section");
}

} // namespace

void write_doc_text_html(HTML_Writer& out, std::u8string_view text, const Doc_HTML_Context& context)
{
    const std::pmr::u8string linked = context.autolinker(text, context.memory);
    render_markdown(out, linked, context.highlighter, context.logger, context.memory);
}

void write_doc_inline_html(
    HTML_Writer& out,
    std::u8string_view text,
    const Doc_HTML_Context& context
)
{
    const std::pmr::u8string linked = context.autolinker(text, context.memory);
    render_inline_markdown(out, linked);
}

void write_doc_comment_html(
    HTML_Writer& out,
    const Doc_Comment& comment,
    const Doc_HTML_Context& context
)
{
    out.open_tag_with_attributes(u8"div").write_class(u8"description").end();
    if (comment.empty()) {
        out.write_element(u8"p", u8"No description provided.");
        out.close_tag(u8"div");
        return;
    }

    if (comment.version || comment.since) {
        out.open_tag_with_attributes(u8"div").write_class(u8"tags").end();
        if (comment.version) {
            std::pmr::u8string text { u8"Version ", context.memory };
            text += *comment.version;
            out.write_element(u8"p", text);
        }
        if (comment.since) {
            std::pmr::u8string text { u8"Since ", context.memory };
            text += *comment.since;
            out.write_element(u8"p", text);
        }
        out.close_tag(u8"div");
    }

    if (comment.description) {
        write_doc_text_html(out, *comment.description, context);
    }
    write_params_section(out, comment.params, u8"params", u8"Parameters", context);
    write_params_section(
        out, comment.tparams, u8"params template", u8"Template parameters", context
    );
    if (comment.returns) {
        write_text_section(out, *comment.returns, u8"params returns", u8"Returns", context);
    }
    if (comment.throws) {
        write_text_section(out, *comment.throws, u8"params throws", u8"Throws", context);
    }
    if (!comment.see.empty()) {
        open_section(out, u8"see", u8"See also");
        out.open_tag(u8"ul");
        for (const std::pmr::u8string& see : comment.see) {
            out.open_tag(u8"li");
            write_doc_inline_html(out, see, context);
            out.close_tag(u8"li");
        }
        out.close_tag(u8"ul");
        out.close_tag(u8"section");
    }
    for (const std::pmr::u8string& note : comment.notes) {
        write_text_section(out, note, u8"note", u8"Note", context);
    }
    for (const std::pmr::u8string& warning : comment.warnings) {
        write_text_section(out, warning, u8"warning", u8"Warning", context);
    }
    for (const Doc_Example& example : comment.examples) {
        write_example(out, example, context);
    }
    out.close_tag(u8"div");
}

} // namespace lantern
