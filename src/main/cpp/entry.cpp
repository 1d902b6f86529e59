#include <algorithm>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "lantern/util/html_writer.hpp"

#include "lantern/autolink.hpp"
#include "lantern/builder.hpp"
#include "lantern/diagnostic.hpp"
#include "lantern/doc_comment.hpp"
#include "lantern/doc_html.hpp"
#include "lantern/entry.hpp"
#include "lantern/file_tree.hpp"
#include "lantern/linker.hpp"
#include "lantern/nav.hpp"
#include "lantern/services.hpp"
#include "lantern/symbol_graph.hpp"
#include "lantern/tutorial_tree.hpp"

namespace lantern {
namespace {

template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

[[nodiscard]]
std::u8string page_href(const Build_Context& context, const Url_Path& url)
{
    return context.linker.page_url(url).to_encoded_string();
}

/// @brief Returns `true` if `symbol` is listed in namespaces and the navigation.
[[nodiscard]]
bool is_listed(const Build_Context& context, const Symbol& symbol)
{
    return symbol.has_page() && !context.linker.is_external(symbol);
}

[[nodiscard]]
Source_Location location_of(const Symbol& symbol)
{
    if (!symbol.location) {
        return {};
    }
    const ast::Location& location = *symbol.location;
    return { .file = location.file,
             .begin = location.begin,
             .length = location.end > location.begin ? location.end - location.begin : 0 };
}

/// @brief Returns `true` if `symbol` is declared in the file at `path`.
[[nodiscard]]
bool is_declared_in(const Symbol& symbol, const Url_Path& path)
{
    return symbol.location && Url_Path::parse(symbol.location->file) == path;
}

[[nodiscard]]
Doc_Comment parse_comment_of(
    const Symbol& symbol,
    const Build_Context& context,
    std::pmr::memory_resource* memory
)
{
    if (!symbol.raw_comment) {
        if (context.logger.can_log(Severity::warning)) {
            std::pmr::u8string message { memory };
            message += symbol_kind_name(symbol.kind);
            message += u8" \"";
            message += symbol.qualified_name_string();
            message += u8"\" has no documentation comment.";
            context.logger.log(
                Severity::warning, diagnostic::comment_missing, message, location_of(symbol)
            );
        }
        return Doc_Comment { memory };
    }
    return parse_doc_comment(*symbol.raw_comment, context.logger, location_of(symbol), memory);
}

struct Content_Writer {
    HTML_Writer& out;
    const Build_Context& context;
    std::pmr::memory_resource* memory;
    Autolinker autolinker { context.graph, context.linker };

    [[nodiscard]]
    Doc_HTML_Context doc_context() const
    {
        return { .autolinker = autolinker,
                 .highlighter = context.highlighter,
                 .logger = context.logger,
                 .memory = memory };
    }

    void write_heading(std::u8string_view category, std::u8string_view name)
    {
        out.open_tag(u8"h1");
        out.open_tag_with_attributes(u8"span").write_class(u8"category").end();
        out.write_inner_text(category);
        out.close_tag(u8"span");
        out.write_inner_html(u8' ');
        out.write_inner_text(name);
        out.close_tag(u8"h1");
    }

    void open_section(std::u8string_view title, std::size_t count)
    {
        out.open_tag_with_attributes(u8"details")
            .write_empty_attribute(u8"open")
            .write_class(u8"section")
            .end();
        out.open_tag(u8"summary");
        out.write_inner_text(title);
        out.write_inner_html(u8' ');
        out.open_tag_with_attributes(u8"span").write_class(u8"badge").end();
        out.write_inner_text(std::u8string_view { to_u8string(count) });
        out.close_tag(u8"span");
        out.close_tag(u8"summary");
        out.open_tag(u8"div");
    }

    void close_section()
    {
        out.close_tag(u8"div");
        out.close_tag(u8"details");
    }

    [[nodiscard]]
    static std::u8string to_u8string(std::size_t n)
    {
        const std::string digits = std::to_string(n);
        return std::u8string { digits.begin(), digits.end() };
    }

    /// @brief Writes the include directive of the header `file`,
    /// and a link to its source if possible.
    void write_include(std::u8string_view file)
    {
        const std::optional<Url_Path> header = context.linker.header_path(file);
        const std::optional<std::u8string> source = context.linker.source_url(file);
        if (!header && !source) {
            return;
        }
        out.open_tag_with_attributes(u8"div").write_class(u8"include").end();
        if (header) {
            std::pmr::u8string directive { u8"#include <", memory };
            directive += header->to_raw_string();
            directive += u8'>';
            out.write_element(u8"code", directive);
        }
        if (source) {
            if (header) {
                out.write_inner_html(u8' ');
            }
            out.open_tag_with_attributes(u8"a").write_href(*source).end();
            out.write_inner_text(u8"View source");
            out.close_tag(u8"a");
        }
        out.close_tag(u8"div");
    }

    /// @brief Writes `type`, linked to the declaration named by `target` if it can be resolved.
    void write_type(std::u8string_view type, const std::vector<std::u8string>& target)
    {
        const Symbol* const resolved
            = target.empty() ? nullptr : context.linker.resolve(context.graph, target, context.logger);
        if (!resolved) {
            out.write_inner_text(type);
            return;
        }
        out.open_tag_with_attributes(u8"a").write_href(context.linker.href(*resolved)).end();
        out.write_inner_text(type);
        out.close_tag(u8"a");
    }

    void write_signature(const Symbol& symbol)
    {
        out.open_tag_with_attributes(u8"pre").write_class(u8"signature").end();
        out.open_tag(u8"code");
        switch (symbol.kind) {
        case Symbol_Kind::function:
        case Symbol_Kind::method: {
            if (symbol.is_static) {
                out.write_inner_text(u8"static ");
            }
            if (symbol.is_virtual) {
                out.write_inner_text(u8"virtual ");
            }
            if (!symbol.type.empty()) {
                write_type(symbol.type, symbol.type_target);
                out.write_inner_html(u8' ');
            }
            out.write_inner_text(symbol.display_name());
            out.write_inner_html(u8'(');
            for (std::size_t i = 0; i < symbol.parameters.size(); ++i) {
                const Parameter& parameter = symbol.parameters[i];
                if (i != 0) {
                    out.write_inner_text(u8", ");
                }
                write_type(parameter.type, parameter.type_target);
                if (!parameter.name.empty()) {
                    out.write_inner_html(u8' ');
                    out.write_inner_text(parameter.name);
                }
            }
            out.write_inner_html(u8')');
            if (symbol.is_const) {
                out.write_inner_text(u8" const");
            }
            if (symbol.is_pure_virtual) {
                out.write_inner_text(u8" = 0");
            }
            break;
        }
        case Symbol_Kind::field: {
            if (symbol.is_static) {
                out.write_inner_text(u8"static ");
            }
            write_type(symbol.type, symbol.type_target);
            out.write_inner_html(u8' ');
            out.write_inner_text(symbol.display_name());
            break;
        }
        default: {
            out.write_inner_text(symbol.signature());
            break;
        }
        }
        out.close_tag(u8"code");
        out.close_tag(u8"pre");
    }

    void write_comment(const Symbol& symbol)
    {
        const Doc_Comment comment = parse_comment_of(symbol, context, memory);
        write_doc_comment_html(out, comment, doc_context());
    }

    /// @brief Writes a section listing links to `symbols`.
    void write_link_section(std::u8string_view title, const std::vector<const Symbol*>& symbols)
    {
        if (symbols.empty()) {
            return;
        }
        open_section(title, symbols.size());
        out.open_tag(u8"ul");
        for (const Symbol* const symbol : symbols) {
            out.open_tag(u8"li");
            out.open_tag_with_attributes(u8"a").write_href(context.linker.href(*symbol)).end();
            out.write_inner_text(symbol->display_name());
            out.close_tag(u8"a");
            out.close_tag(u8"li");
        }
        out.close_tag(u8"ul");
        close_section();
    }

    /// @brief Writes sections for the namespaces, classes, structs and functions in `scope`.
    void write_scope_listing(const Symbol& scope)
    {
        std::vector<const Symbol*> by_kind[4];
        for (const Symbol& child : scope.children) {
            if (!is_listed(context, child)) {
                continue;
            }
            switch (child.kind) {
            case Symbol_Kind::namespace_: by_kind[0].push_back(&child); break;
            case Symbol_Kind::class_: by_kind[1].push_back(&child); break;
            case Symbol_Kind::struct_: by_kind[2].push_back(&child); break;
            case Symbol_Kind::function: by_kind[3].push_back(&child); break;
            default: break;
            }
        }
        write_link_section(u8"Namespaces", by_kind[0]);
        write_link_section(u8"Classes", by_kind[1]);
        write_link_section(u8"Structs", by_kind[2]);
        write_link_section(u8"Functions", by_kind[3]);
    }

    /// @brief Writes the members of `record` with the given kind and access as one section.
    void write_member_section(
        std::u8string_view title,
        const Symbol& record,
        Symbol_Kind kind,
        Access_Specifier access,
        bool is_static,
        std::pmr::unordered_set<std::u8string_view>& used_anchors
    )
    {
        std::vector<const Symbol*> members;
        for (const Symbol& child : record.children) {
            const bool access_matches = child.access == access
                || (access == Access_Specifier::public_ && child.access == Access_Specifier::none);
            if (child.kind == kind && access_matches
                && (kind == Symbol_Kind::field || child.is_static == is_static)) {
                members.push_back(&child);
            }
        }
        if (members.empty()) {
            return;
        }
        open_section(title, members.size());
        for (const Symbol* const member : members) {
            // Overloads share a name, so only the first one can be the target of the anchor.
            const std::u8string_view anchor = context.linker.anchor(*member);
            Attribute_Writer attributes = out.open_tag_with_attributes(u8"div");
            attributes.write_class(u8"member");
            if (used_anchors.insert(anchor).second) {
                attributes.write_id(anchor);
            }
            attributes.end();
            write_signature(*member);
            write_comment(*member);
            out.close_tag(u8"div");
        }
        close_section();
    }

    void write_symbol_page(const Symbol& symbol)
    {
        write_heading(symbol_kind_name(symbol.kind), symbol.display_name());
        if (symbol.location) {
            write_include(symbol.location->file);
        }
        if (symbol.kind != Symbol_Kind::namespace_) {
            write_signature(symbol);
        }
        write_comment(symbol);

        switch (symbol.kind) {
        case Symbol_Kind::namespace_: {
            write_scope_listing(symbol);
            break;
        }
        case Symbol_Kind::class_:
        case Symbol_Kind::struct_: {
            std::pmr::unordered_set<std::u8string_view> used_anchors { memory };
            write_member_section(
                u8"Public static methods", symbol, Symbol_Kind::method, Access_Specifier::public_,
                true, used_anchors
            );
            write_member_section(
                u8"Public member functions", symbol, Symbol_Kind::method,
                Access_Specifier::public_, false, used_anchors
            );
            write_member_section(
                u8"Protected static methods", symbol, Symbol_Kind::method,
                Access_Specifier::protected_, true, used_anchors
            );
            write_member_section(
                u8"Protected member functions", symbol, Symbol_Kind::method,
                Access_Specifier::protected_, false, used_anchors
            );
            write_member_section(
                u8"Fields", symbol, Symbol_Kind::field, Access_Specifier::public_, false,
                used_anchors
            );
            write_member_section(
                u8"Protected fields", symbol, Symbol_Kind::field, Access_Specifier::protected_,
                false, used_anchors
            );
            break;
        }
        default: break;
        }
    }

    void write_file_page(const File_Root& root, const File_Node& node)
    {
        write_heading(u8"file", node.name);
        const std::u8string absolute = node.absolute_path.generic_u8string();
        write_include(absolute);

        const Url_Path path = Url_Path::parse(absolute);
        const auto declared_here = [&](Symbol_Kind kind) {
            const auto predicate = [&](const Symbol& symbol) {
                return symbol.kind == kind && is_declared_in(symbol, path)
                    && !context.linker.is_external(symbol);
            };
            return context.graph.select(predicate);
        };
        write_link_section(u8"Functions", declared_here(Symbol_Kind::function));
        write_link_section(u8"Classes", declared_here(Symbol_Kind::class_));
        write_link_section(u8"Structs", declared_here(Symbol_Kind::struct_));

        out.open_tag_with_attributes(u8"p").write_class(u8"path").end();
        out.write_inner_text(root.name);
        out.write_inner_html(u8'/');
        out.write_inner_text(node.relative_path.to_raw_string());
        out.close_tag(u8"p");
    }

    void write_tutorial(const Tutorial& tutorial)
    {
        out.open_tag_with_attributes(u8"article").write_class(u8"tutorial").end();
        write_doc_text_html(out, tutorial.markdown, doc_context());
        out.close_tag(u8"article");
    }

    void write_tutorial_folder(const Tutorial_Folder& folder)
    {
        if (folder.index) {
            write_tutorial(*folder.index);
        }
        else {
            out.write_element(u8"h1", folder.title);
        }
        if (folder.children.empty()) {
            return;
        }
        open_section(u8"Contents", folder.children.size());
        out.open_tag(u8"ul");
        for (const Tutorial_Node& child : folder.children) {
            const auto [title, url] = std::visit(
                [](const auto& node) -> std::pair<std::u8string_view, const Url_Path*> {
                    return { node.title, &node.url };
                },
                child.value
            );
            out.open_tag(u8"li");
            out.open_tag_with_attributes(u8"a").write_href(page_href(context, *url)).end();
            out.write_inner_text(title);
            out.close_tag(u8"a");
            out.close_tag(u8"li");
        }
        out.close_tag(u8"ul");
        close_section();
    }

    void write_index()
    {
        const Project_Config& project = context.config.project;
        out.open_tag(u8"h1");
        out.write_inner_text(project.name);
        out.write_inner_html(u8' ');
        out.open_tag_with_attributes(u8"span").write_class(u8"version").end();
        out.write_inner_text(project.version);
        out.close_tag(u8"span");
        out.close_tag(u8"h1");
        if (!project.repository.empty()) {
            out.open_tag(u8"p");
            out.open_tag_with_attributes(u8"a").write_href(project.repository).end();
            out.write_inner_text(u8"Repository");
            out.close_tag(u8"a");
            out.close_tag(u8"p");
        }
        write_scope_listing(context.graph.root());
        if (context.tutorials) {
            write_tutorial_folder_listing(*context.tutorials);
        }
    }

    void write_tutorial_folder_listing(const Tutorial_Folder& folder)
    {
        if (folder.children.empty() && !folder.index) {
            return;
        }
        out.open_tag(u8"p");
        out.open_tag_with_attributes(u8"a").write_href(page_href(context, folder.url)).end();
        out.write_inner_text(folder.title);
        out.close_tag(u8"a");
        out.close_tag(u8"p");
    }
};

[[nodiscard]]
Nav_Item make_link(const Build_Context& context, std::u8string_view name, const Url_Path& url)
{
    return Nav_Item { Nav_Link { .name = std::u8string { name },
                                 .href = page_href(context, url),
                                 .anchors = {} } };
}

[[nodiscard]]
std::vector<Nav_Item> children_nav(const Entry& entry, const Build_Context& context)
{
    std::vector<Nav_Item> result;
    for (const Entry& child : entry.children(context)) {
        result.push_back(child.nav(context));
    }
    return result;
}

[[nodiscard]]
std::vector<Entry> file_entries(const File_Root& root, const std::vector<File_Node>& nodes)
{
    std::vector<Entry> result;
    result.reserve(nodes.size());
    for (const File_Node& node : nodes) {
        if (node.is_directory) {
            result.push_back(Entry { Directory_Entry { &root, &node } });
        }
        else {
            result.push_back(Entry { File_Entry { &root, &node } });
        }
    }
    return result;
}

[[nodiscard]]
std::u8string make_title(std::u8string_view name, std::u8string_view project)
{
    std::u8string result { name };
    result += u8" Docs in ";
    result += project;
    return result;
}

} // namespace

std::u8string_view Entry::name() const noexcept
{
    return std::visit(
        Overloaded {
            [](const Index_Entry&) -> std::u8string_view { return u8"Home"; },
            [](const Namespace_Entry& e) -> std::u8string_view {
                return e.symbol->display_name();
            },
            [](const Record_Entry& e) -> std::u8string_view { return e.symbol->display_name(); },
            [](const Function_Entry& e) -> std::u8string_view {
                return e.symbol->display_name();
            },
            [](const File_Entry& e) -> std::u8string_view { return e.node->name; },
            [](const Directory_Entry& e) -> std::u8string_view { return e.node->name; },
            [](const File_Root_Entry& e) -> std::u8string_view { return e.root->name; },
            [](const Tutorial_Entry& e) -> std::u8string_view { return e.tutorial->title; },
            [](const Tutorial_Folder_Entry& e) -> std::u8string_view { return e.folder->title; },
        },
        value
    );
}

Url_Path Entry::url(const Build_Context& context) const
{
    return std::visit(
        Overloaded {
            [](const Index_Entry&) { return Url_Path {}; },
            [&](const Namespace_Entry& e) { return context.linker.rel_url(*e.symbol); },
            [&](const Record_Entry& e) { return context.linker.rel_url(*e.symbol); },
            [&](const Function_Entry& e) { return context.linker.rel_url(*e.symbol); },
            [&](const File_Entry& e) {
                return context.linker.file_url(e.root->name, e.node->relative_path);
            },
            [&](const Directory_Entry& e) {
                return context.linker.file_url(e.root->name, e.node->relative_path);
            },
            [&](const File_Root_Entry& e) { return context.linker.file_url(e.root->name, {}); },
            [](const Tutorial_Entry& e) { return e.tutorial->url; },
            [](const Tutorial_Folder_Entry& e) { return e.folder->url; },
        },
        value
    );
}

bool Entry::has_page() const noexcept
{
    return std::visit(
        Overloaded {
            [](const Namespace_Entry& e) { return e.symbol->kind != Symbol_Kind::root; },
            [](const Directory_Entry&) { return false; },
            [](const File_Root_Entry&) { return false; },
            [](const Tutorial_Folder_Entry& e) { return e.folder->index.has_value(); },
            [](const auto&) { return true; },
        },
        value
    );
}

std::vector<Entry> Entry::children(const Build_Context& context) const
{
    return std::visit(
        Overloaded {
            [&](const Namespace_Entry& e) {
                std::vector<Entry> result;
                for (const Symbol& child : e.symbol->children) {
                    if (!is_listed(context, child)) {
                        continue;
                    }
                    switch (child.kind) {
                    case Symbol_Kind::namespace_:
                        result.push_back(Entry { Namespace_Entry { &child } });
                        break;
                    case Symbol_Kind::class_:
                    case Symbol_Kind::struct_:
                        result.push_back(Entry { Record_Entry { &child } });
                        break;
                    case Symbol_Kind::function:
                        result.push_back(Entry { Function_Entry { &child } });
                        break;
                    default: break;
                    }
                }
                // Namespaces come first, and otherwise entries are ordered by name.
                std::ranges::stable_sort(result, [](const Entry& x, const Entry& y) {
                    const bool x_namespace = std::holds_alternative<Namespace_Entry>(x.value);
                    const bool y_namespace = std::holds_alternative<Namespace_Entry>(y.value);
                    if (x_namespace != y_namespace) {
                        return x_namespace;
                    }
                    return x.name() < y.name();
                });
                return result;
            },
            [](const Directory_Entry& e) { return file_entries(*e.root, e.node->children); },
            [](const File_Root_Entry& e) { return file_entries(*e.root, e.root->children); },
            [](const Tutorial_Folder_Entry& e) {
                std::vector<Entry> result;
                for (const Tutorial_Node& node : e.folder->children) {
                    if (const auto* const tutorial = std::get_if<Tutorial>(&node.value)) {
                        result.push_back(Entry { Tutorial_Entry { tutorial } });
                    }
                    else {
                        result.push_back(
                            Entry { Tutorial_Folder_Entry { &std::get<Tutorial_Folder>(node.value) } }
                        );
                    }
                }
                return result;
            },
            [](const auto&) { return std::vector<Entry> {}; },
        },
        value
    );
}

Nav_Item Entry::nav(const Build_Context& context) const
{
    return std::visit(
        Overloaded {
            [&](const Namespace_Entry& e) -> Nav_Item {
                if (e.symbol->kind == Symbol_Kind::root) {
                    return Nav_Item { Nav_Root { .name = u8"API", .items = children_nav(*this, context) } };
                }
                return Nav_Item { Nav_Dir {
                    .name = std::u8string { name() },
                    .items = children_nav(*this, context),
                    .open = false,
                } };
            },
            [&](const Record_Entry& e) -> Nav_Item {
                Nav_Link link { .name = std::u8string { name() },
                                .href = context.linker.href(*e.symbol),
                                .anchors = {} };
                std::unordered_set<std::u8string_view> seen;
                for (const Symbol& member : e.symbol->children) {
                    if (member.kind == Symbol_Kind::method && seen.insert(member.name()).second) {
                        link.anchors.push_back({ .title = std::u8string { member.display_name() },
                                                 .href = context.linker.href(member) });
                    }
                }
                return Nav_Item { std::move(link) };
            },
            [&](const Directory_Entry&) -> Nav_Item {
                return Nav_Item { Nav_Dir {
                    .name = std::u8string { name() },
                    .items = children_nav(*this, context),
                    .open = false,
                } };
            },
            [&](const File_Root_Entry&) -> Nav_Item {
                return Nav_Item { Nav_Dir {
                    .name = std::u8string { name() },
                    .items = children_nav(*this, context),
                    .open = false,
                } };
            },
            [&](const Tutorial_Folder_Entry& e) -> Nav_Item {
                std::vector<Nav_Item> items;
                if (e.folder->index) {
                    items.push_back(make_link(context, e.folder->index->title, e.folder->url));
                }
                std::vector<Nav_Item> rest = children_nav(*this, context);
                items.insert(
                    items.end(), std::make_move_iterator(rest.begin()),
                    std::make_move_iterator(rest.end())
                );
                if (e.folder->depth == 0) {
                    return Nav_Item { Nav_Root { .name = std::u8string { name() },
                                                 .items = std::move(items) } };
                }
                return Nav_Item { Nav_Dir {
                    .name = std::u8string { name() },
                    .items = std::move(items),
                    .open = e.folder->is_open(),
                } };
            },
            [&](const auto&) -> Nav_Item { return make_link(context, name(), url(context)); },
        },
        value
    );
}

std::vector<Page_Task> Entry::build(Builder& builder) const
{
    std::vector<Page_Task> result;
    if (has_page()) {
        result.push_back(builder.spawn(*this));
    }
    for (const Entry& child : children(builder.context())) {
        std::vector<Page_Task> child_tasks = child.build(builder);
        result.insert(
            result.end(), std::make_move_iterator(child_tasks.begin()),
            std::make_move_iterator(child_tasks.end())
        );
    }
    return result;
}

Page_Info Entry::page_info(const Build_Context& context) const
{
    const std::u8string_view project = context.config.project.name;
    const auto symbol_info = [&](const Symbol& symbol) {
        std::u8string description { u8"Documentation for the " };
        description += symbol.display_name();
        description += u8' ';
        description += symbol_kind_name(symbol.kind);
        description += u8" in ";
        description += project;
        return Page_Info { make_title(symbol.display_name(), project), std::move(description) };
    };

    return std::visit(
        Overloaded {
            [&](const Index_Entry&) {
                std::u8string description { u8"Documentation for " };
                description += project;
                description += u8' ';
                description += context.config.project.version;
                return Page_Info { make_title(u8"Home", project), std::move(description) };
            },
            [&](const Namespace_Entry& e) { return symbol_info(*e.symbol); },
            [&](const Record_Entry& e) { return symbol_info(*e.symbol); },
            [&](const Function_Entry& e) { return symbol_info(*e.symbol); },
            [&](const File_Entry& e) {
                std::u8string description { u8"Documentation for " };
                description += e.root->name;
                description += u8'/';
                description += e.node->relative_path.to_raw_string();
                description += u8" in ";
                description += project;
                return Page_Info { make_title(e.node->name, project), std::move(description) };
            },
            [&](const auto&) {
                std::u8string title { name() };
                title += u8" - ";
                title += project;
                std::u8string description { name() };
                description += u8" in the tutorials of ";
                description += project;
                return Page_Info { std::move(title), std::move(description) };
            },
        },
        value
    );
}

void Entry::write_content(
    HTML_Writer& out,
    const Build_Context& context,
    std::pmr::memory_resource* memory
) const
{
    Content_Writer writer { .out = out, .context = context, .memory = memory };
    std::visit(
        Overloaded {
            [&](const Index_Entry&) { writer.write_index(); },
            [&](const Namespace_Entry& e) { writer.write_symbol_page(*e.symbol); },
            [&](const Record_Entry& e) { writer.write_symbol_page(*e.symbol); },
            [&](const Function_Entry& e) { writer.write_symbol_page(*e.symbol); },
            [&](const File_Entry& e) { writer.write_file_page(*e.root, *e.node); },
            [&](const Tutorial_Entry& e) { writer.write_tutorial(*e.tutorial); },
            [&](const Tutorial_Folder_Entry& e) { writer.write_tutorial_folder(*e.folder); },
            [](const auto&) { },
        },
        value
    );
}

std::vector<Entry> make_root_entries(const Build_Context& context)
{
    std::vector<Entry> result;
    result.push_back(Entry { Index_Entry {} });
    result.push_back(Entry { Namespace_Entry { &context.graph.root() } });
    for (const File_Root& root : context.files) {
        result.push_back(Entry { File_Root_Entry { &root } });
    }
    if (context.tutorials) {
        result.push_back(Entry { Tutorial_Folder_Entry { &*context.tutorials } });
    }
    return result;
}

} // namespace lantern
