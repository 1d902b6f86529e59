#include <span>
#include <string_view>
#include <variant>

#include "lantern/util/html_writer.hpp"

#include "lantern/nav.hpp"

namespace lantern {
namespace {

void write_summarized(
    HTML_Writer& out,
    std::u8string_view name,
    std::span<const Nav_Item> items,
    bool open,
    std::u8string_view css_class
)
{
    Attribute_Writer attributes = out.open_tag_with_attributes(u8"details");
    if (open) {
        attributes.write_empty_attribute(u8"open");
    }
    if (!css_class.empty()) {
        attributes.write_class(css_class);
    }
    attributes.end();

    out.open_tag(u8"summary");
    out.write_inner_text(name);
    out.close_tag(u8"summary");

    out.open_tag(u8"div");
    for (const Nav_Item& item : items) {
        write_nav_html(out, item);
    }
    out.close_tag(u8"div");
    out.close_tag(u8"details");
}

struct Nav_Writer {
    HTML_Writer& out;

    void operator()(const Nav_Link& link) const
    {
        out.open_tag_with_attributes(u8"a").write_href(link.href).end();
        out.write_inner_text(link.name);
        out.close_tag(u8"a");
        if (link.anchors.empty()) {
            return;
        }
        out.open_tag_with_attributes(u8"div").write_class(u8"anchors").end();
        for (const Nav_Anchor& anchor : link.anchors) {
            out.open_tag_with_attributes(u8"a").write_href(anchor.href).end();
            out.write_inner_text(anchor.title);
            out.close_tag(u8"a");
        }
        out.close_tag(u8"div");
    }

    void operator()(const Nav_Dir& dir) const
    {
        write_summarized(out, dir.name, dir.items, dir.open, {});
    }

    void operator()(const Nav_Root& root) const
    {
        if (root.name) {
            write_summarized(out, *root.name, root.items, true, u8"root");
            return;
        }
        out.open_tag(u8"div");
        for (const Nav_Item& item : root.items) {
            write_nav_html(out, item);
        }
        out.close_tag(u8"div");
    }
};

} // namespace

void write_nav_html(HTML_Writer& out, const Nav_Item& item)
{
    std::visit(Nav_Writer { out }, item.value);
}

} // namespace lantern
