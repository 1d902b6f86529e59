#ifndef LANTERN_SYMBOL_GRAPH_HPP
#define LANTERN_SYMBOL_GRAPH_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/function_ref.hpp"

#include "lantern/ast.hpp"
#include "lantern/fwd.hpp"

namespace lantern {

enum struct Symbol_Kind : Default_Underlying {
    /// @brief The global namespace, which only exists as the root of a `Symbol_Graph`.
    root,
    namespace_,
    class_,
    struct_,
    function,
    method,
    field,
};

[[nodiscard]]
constexpr std::u8string_view symbol_kind_name(Symbol_Kind kind)
{
    switch (kind) {
    case Symbol_Kind::root: return u8"root";
    case Symbol_Kind::namespace_: return u8"namespace";
    case Symbol_Kind::class_: return u8"class";
    case Symbol_Kind::struct_: return u8"struct";
    case Symbol_Kind::function: return u8"function";
    case Symbol_Kind::method: return u8"method";
    case Symbol_Kind::field: return u8"field";
    }
    return u8"";
}

/// @brief Returns `true` if symbols of the given kind are documented on their own page,
/// as opposed to on the page of their parent.
[[nodiscard]]
constexpr bool symbol_kind_has_page(Symbol_Kind kind)
{
    switch (kind) {
    case Symbol_Kind::namespace_:
    case Symbol_Kind::class_:
    case Symbol_Kind::struct_:
    case Symbol_Kind::function: return true;
    default: return false;
    }
}

struct Parameter {
    std::u8string name;
    std::u8string type;
    /// @brief The qualified name of the declaration that `type` refers to,
    /// or empty if the type is not a declaration of the project.
    std::vector<std::u8string> type_target;
};

/// @brief A documented C++ entity.
/// Every symbol is exclusively owned by its parent.
struct Symbol {
    Symbol_Kind kind = Symbol_Kind::root;
    /// @brief The kind of the symbol that owns this one.
    Symbol_Kind parent_kind = Symbol_Kind::root;
    std::vector<std::u8string> qualified_name;
    std::optional<ast::Location> location;
    std::optional<std::u8string> raw_comment;
    Access_Specifier access = Access_Specifier::none;
    /// @brief The return type of functions and methods, or the type of fields.
    std::u8string type;
    /// @brief The qualified name of the declaration that `type` refers to, if any.
    std::vector<std::u8string> type_target;
    std::vector<Parameter> parameters;
    bool is_static = false;
    bool is_const = false;
    bool is_virtual = false;
    bool is_pure_virtual = false;
    std::vector<Symbol> children;

    /// @brief Returns the unqualified name, or an empty string for the root.
    [[nodiscard]]
    std::u8string_view name() const noexcept
    {
        return qualified_name.empty() ? std::u8string_view {}
                                      : std::u8string_view { qualified_name.back() };
    }

    /// @brief Returns the name components joined with `::`, like `std::vector`.
    [[nodiscard]]
    std::u8string qualified_name_string() const;

    /// @brief Returns the name to display for this symbol.
    /// This is the unqualified name, or a placeholder like `<Anonymous namespace>`.
    [[nodiscard]]
    std::u8string_view display_name() const noexcept;

    /// @brief Returns the spelling of the declaration, like `static int get(float x) const`.
    [[nodiscard]]
    std::u8string signature() const;

    [[nodiscard]]
    bool is_member() const noexcept
    {
        return kind == Symbol_Kind::method || kind == Symbol_Kind::field;
    }

    [[nodiscard]]
    bool has_page() const noexcept
    {
        return symbol_kind_has_page(kind);
    }
};

/// @brief The canonical, de-duplicated tree of documented symbols of a project.
/// Once built, a graph is immutable and may be shared between threads.
struct Symbol_Graph {
private:
    Symbol m_root;

public:
    /// @brief Constructs an empty graph, consisting only of the root.
    [[nodiscard]]
    Symbol_Graph() = default;

    /// @brief Builds a graph from the given translation units.
    ///
    /// Entities in system headers, entities without a name, and implicit entities are skipped.
    /// Namespaces with the same qualified name are merged into one symbol.
    /// Of multiple definitions of a class or struct, the first one wins,
    /// and forward declarations are ignored.
    /// Classes and structs nested in other classes or structs are skipped,
    /// and so are private members.
    /// Functions with the same qualified name are merged into one symbol,
    /// where the first declaration wins but the first documentation comment is kept.
    [[nodiscard]]
    static Symbol_Graph build(std::span<const ast::Entity> translation_units);

    [[nodiscard]]
    const Symbol& root() const noexcept
    {
        return m_root;
    }

    /// @brief Returns every symbol except the root that satisfies `predicate`,
    /// in depth-first pre-order.
    [[nodiscard]]
    std::vector<const Symbol*> select(Function_Ref<bool(const Symbol&)> predicate) const;

    /// @brief Invokes `action` for every symbol except the root, in depth-first pre-order.
    void for_each(Function_Ref<void(const Symbol&)> action) const;

    /// @brief Returns the symbol with the given qualified name, or `nullptr` if none exists.
    [[nodiscard]]
    const Symbol* find(std::span<const std::u8string> qualified_name) const noexcept;

    [[nodiscard]]
    const Symbol* find(std::span<const std::u8string_view> qualified_name) const noexcept;
};

} // namespace lantern

#endif
