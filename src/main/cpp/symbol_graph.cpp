#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lantern/util/function_ref.hpp"

#include "lantern/ast.hpp"
#include "lantern/symbol_graph.hpp"

namespace lantern {
namespace {

using Qualified_Name = std::vector<std::u8string>;

[[nodiscard]]
bool is_documented(const ast::Entity& entity)
{
    return !entity.is_implicit && !entity.is_in_system_header && !entity.name.empty();
}

/// @brief Returns `true` if `entity` is a member that the page of its class documents.
/// Private members are implementation details.
[[nodiscard]]
bool is_visible_member(const ast::Entity& entity)
{
    return entity.access != Access_Specifier::private_;
}

[[nodiscard]]
bool is_scope(Symbol_Kind kind)
{
    return kind == Symbol_Kind::root || kind == Symbol_Kind::namespace_;
}

[[nodiscard]]
bool is_record(Symbol_Kind kind)
{
    return kind == Symbol_Kind::class_ || kind == Symbol_Kind::struct_;
}

[[nodiscard]]
Symbol* find_child(Symbol& parent, std::u8string_view name, bool (*kind_filter)(Symbol_Kind))
{
    const auto it = std::ranges::find_if(parent.children, [&](const Symbol& child) {
        return kind_filter(child.kind) && child.name() == name;
    });
    return it == parent.children.end() ? nullptr : &*it;
}

struct Graph_Builder {
    /// @brief Maps the front-end id of each class and struct to its qualified name,
    /// so that types can link to the declarations they name.
    std::unordered_map<std::u8string, Qualified_Name> targets;

    void index(const ast::Entity& entity, Qualified_Name& scope)
    {
        for (const ast::Entity& child : entity.children) {
            if (!is_documented(child)) {
                continue;
            }
            const bool is_class_or_struct = child.kind == ast::Entity_Kind::class_decl
                || child.kind == ast::Entity_Kind::struct_decl;
            if (child.kind != ast::Entity_Kind::namespace_decl && !is_class_or_struct) {
                continue;
            }
            scope.push_back(child.name);
            if (is_class_or_struct) {
                // Records nested in records are not part of the graph.
                if (!child.id.empty()) {
                    targets.try_emplace(child.id, scope);
                }
            }
            else {
                index(child, scope);
            }
            scope.pop_back();
        }
    }

    [[nodiscard]]
    Qualified_Name target_of(const ast::Entity& entity) const
    {
        if (entity.referenced_id.empty()) {
            return {};
        }
        const auto it = targets.find(entity.referenced_id);
        return it == targets.end() ? Qualified_Name {} : it->second;
    }

    [[nodiscard]]
    Symbol make_symbol(Symbol_Kind kind, const Symbol& parent, const ast::Entity& entity) const
    {
        Symbol result {
            .kind = kind,
            .parent_kind = parent.kind,
            .qualified_name = parent.qualified_name,
            .location = entity.location,
            .raw_comment = entity.raw_comment,
            .access = entity.access,
            .type = entity.type,
            .type_target = target_of(entity),
            .parameters = {},
            .is_static = entity.is_static,
            .is_const = entity.is_const,
            .is_virtual = entity.is_virtual || entity.is_pure_virtual,
            .is_pure_virtual = entity.is_pure_virtual,
            .children = {},
        };
        result.qualified_name.push_back(entity.name);
        return result;
    }

    void insert_children(Symbol& parent, const ast::Entity& entity)
    {
        for (const ast::Entity& child : entity.children) {
            insert(parent, child);
        }
    }

    void insert(Symbol& parent, const ast::Entity& entity)
    {
        if (!is_documented(entity)) {
            return;
        }
        switch (entity.kind) {
        case ast::Entity_Kind::namespace_decl: {
            if (!is_scope(parent.kind)) {
                return;
            }
            Symbol* existing = find_child(parent, entity.name, [](Symbol_Kind kind) {
                return kind == Symbol_Kind::namespace_;
            });
            if (!existing) {
                existing = &parent.children.emplace_back(
                    make_symbol(Symbol_Kind::namespace_, parent, entity)
                );
            }
            else if (!existing->raw_comment && entity.raw_comment) {
                existing->raw_comment = entity.raw_comment;
            }
            insert_children(*existing, entity);
            return;
        }
        case ast::Entity_Kind::class_decl:
        case ast::Entity_Kind::struct_decl: {
            if (!is_scope(parent.kind) || !entity.is_definition
                || find_child(parent, entity.name, is_record)) {
                return;
            }
            const Symbol_Kind kind = entity.kind == ast::Entity_Kind::class_decl
                ? Symbol_Kind::class_
                : Symbol_Kind::struct_;
            Symbol& record = parent.children.emplace_back(make_symbol(kind, parent, entity));
            insert_children(record, entity);
            return;
        }
        case ast::Entity_Kind::function_decl: {
            if (!is_scope(parent.kind)) {
                return;
            }
            if (Symbol* const existing = find_child(parent, entity.name, [](Symbol_Kind kind) {
                    return kind == Symbol_Kind::function;
                })) {
                if (!existing->raw_comment && entity.raw_comment) {
                    existing->raw_comment = entity.raw_comment;
                }
                return;
            }
            insert_function(parent, Symbol_Kind::function, entity);
            return;
        }
        case ast::Entity_Kind::method_decl: {
            // Out-of-line definitions appear at namespace scope and repeat an in-class declaration.
            if (is_record(parent.kind) && is_visible_member(entity)) {
                insert_function(parent, Symbol_Kind::method, entity);
            }
            return;
        }
        case ast::Entity_Kind::field_decl: {
            if (is_record(parent.kind) && is_visible_member(entity)) {
                parent.children.push_back(make_symbol(Symbol_Kind::field, parent, entity));
            }
            return;
        }
        default: return;
        }
    }

    void insert_function(Symbol& parent, Symbol_Kind kind, const ast::Entity& entity)
    {
        Symbol function = make_symbol(kind, parent, entity);
        for (const ast::Entity& child : entity.children) {
            if (child.kind != ast::Entity_Kind::param_decl) {
                continue;
            }
            function.parameters.push_back(Parameter {
                .name = child.name,
                .type = child.type,
                .type_target = target_of(child),
            });
        }
        parent.children.push_back(std::move(function));
    }
};

void select_recursive(
    std::vector<const Symbol*>& out,
    const Symbol& symbol,
    Function_Ref<bool(const Symbol&)> predicate
)
{
    for (const Symbol& child : symbol.children) {
        if (predicate(child)) {
            out.push_back(&child);
        }
        select_recursive(out, child, predicate);
    }
}

void for_each_recursive(const Symbol& symbol, Function_Ref<void(const Symbol&)> action)
{
    for (const Symbol& child : symbol.children) {
        action(child);
        for_each_recursive(child, action);
    }
}

template <typename String>
[[nodiscard]]
const Symbol* find_impl(const Symbol& root, std::span<const String> qualified_name)
{
    const Symbol* current = &root;
    for (const String& component : qualified_name) {
        const auto it = std::ranges::find_if(current->children, [&](const Symbol& child) {
            return child.name() == std::u8string_view { component };
        });
        if (it == current->children.end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current == &root ? nullptr : current;
}

} // namespace

std::u8string Symbol::qualified_name_string() const
{
    std::u8string result;
    for (const std::u8string& component : qualified_name) {
        if (!result.empty()) {
            result += u8"::";
        }
        result += component;
    }
    return result;
}

std::u8string_view Symbol::display_name() const noexcept
{
    if (!qualified_name.empty() && !qualified_name.back().empty()) {
        return qualified_name.back();
    }
    switch (kind) {
    case Symbol_Kind::root: return u8"<Global namespace>";
    case Symbol_Kind::namespace_: return u8"<Anonymous namespace>";
    case Symbol_Kind::class_: return u8"<Anonymous class>";
    case Symbol_Kind::struct_: return u8"<Anonymous struct>";
    default: return u8"<Anonymous>";
    }
}

std::u8string Symbol::signature() const
{
    std::u8string result;
    switch (kind) {
    case Symbol_Kind::root:
    case Symbol_Kind::namespace_:
    case Symbol_Kind::class_:
    case Symbol_Kind::struct_: {
        result += symbol_kind_name(kind);
        result += u8' ';
        result += qualified_name_string();
        break;
    }
    case Symbol_Kind::field: {
        if (is_static) {
            result += u8"static ";
        }
        result += type;
        result += u8' ';
        result += name();
        break;
    }
    case Symbol_Kind::function:
    case Symbol_Kind::method: {
        if (is_static) {
            result += u8"static ";
        }
        if (is_virtual) {
            result += u8"virtual ";
        }
        result += type;
        if (!type.empty()) {
            result += u8' ';
        }
        result += name();
        result += u8'(';
        for (std::size_t i = 0; i < parameters.size(); ++i) {
            if (i != 0) {
                result += u8", ";
            }
            result += parameters[i].type;
            if (!parameters[i].name.empty()) {
                result += u8' ';
                result += parameters[i].name;
            }
        }
        result += u8')';
        if (is_const) {
            result += u8" const";
        }
        if (is_pure_virtual) {
            result += u8" = 0";
        }
        break;
    }
    }
    return result;
}

Symbol_Graph Symbol_Graph::build(std::span<const ast::Entity> translation_units)
{
    Graph_Builder builder;
    Qualified_Name scope;
    for (const ast::Entity& unit : translation_units) {
        builder.index(unit, scope);
    }

    Symbol_Graph result;
    for (const ast::Entity& unit : translation_units) {
        builder.insert_children(result.m_root, unit);
    }
    return result;
}

std::vector<const Symbol*> Symbol_Graph::select(Function_Ref<bool(const Symbol&)> predicate) const
{
    std::vector<const Symbol*> result;
    select_recursive(result, m_root, predicate);
    return result;
}

void Symbol_Graph::for_each(Function_Ref<void(const Symbol&)> action) const
{
    for_each_recursive(m_root, action);
}

const Symbol* Symbol_Graph::find(std::span<const std::u8string> qualified_name) const noexcept
{
    return find_impl(m_root, qualified_name);
}

const Symbol* Symbol_Graph::find(std::span<const std::u8string_view> qualified_name) const noexcept
{
    return find_impl(m_root, qualified_name);
}

} // namespace lantern
