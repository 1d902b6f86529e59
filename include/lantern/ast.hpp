#ifndef LANTERN_AST_HPP
#define LANTERN_AST_HPP

#include <cstddef>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/result.hpp"

#include "lantern/fwd.hpp"

namespace lantern {

enum struct Access_Specifier : Default_Underlying {
    none,
    public_,
    protected_,
    private_,
};

[[nodiscard]]
constexpr std::u8string_view access_specifier_name(Access_Specifier access)
{
    switch (access) {
    case Access_Specifier::none: return u8"";
    case Access_Specifier::public_: return u8"public";
    case Access_Specifier::protected_: return u8"protected";
    case Access_Specifier::private_: return u8"private";
    }
    return u8"";
}

} // namespace lantern

namespace lantern::ast {

/// @brief The kinds of declarations that are relevant for documentation.
/// Anything else is `other`.
enum struct Entity_Kind : Default_Underlying {
    translation_unit,
    namespace_decl,
    class_decl,
    struct_decl,
    function_decl,
    method_decl,
    field_decl,
    param_decl,
    other,
};

[[nodiscard]]
constexpr std::u8string_view entity_kind_name(Entity_Kind kind)
{
    using enum Entity_Kind;
    switch (kind) {
        LANTERN_ENUM_STRING_CASE8(translation_unit);
        LANTERN_ENUM_STRING_CASE8(namespace_decl);
        LANTERN_ENUM_STRING_CASE8(class_decl);
        LANTERN_ENUM_STRING_CASE8(struct_decl);
        LANTERN_ENUM_STRING_CASE8(function_decl);
        LANTERN_ENUM_STRING_CASE8(method_decl);
        LANTERN_ENUM_STRING_CASE8(field_decl);
        LANTERN_ENUM_STRING_CASE8(param_decl);
        LANTERN_ENUM_STRING_CASE8(other);
    }
    return u8"";
}

/// @brief The range of bytes within a source file that an entity spans.
struct Location {
    std::u8string file;
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]]
    friend bool operator==(const Location&, const Location&)
        = default;
};

/// @brief A node in the AST of a translation unit, as produced by the compiler front-end.
/// Only the information needed for documentation is retained.
struct Entity {
    Entity_Kind kind = Entity_Kind::other;
    /// @brief The front-end's identifier of this declaration,
    /// which other entities use to refer to it.
    std::u8string id;
    /// @brief The unqualified name, or empty for anonymous entities.
    std::u8string name;
    std::optional<Location> location;
    std::optional<std::u8string> raw_comment;
    /// @brief For functions and methods, the return type.
    /// For fields and parameters, the declared type.
    std::u8string type;
    /// @brief The `id` of the declaration that `type` refers to, if any.
    std::u8string referenced_id;
    Access_Specifier access = Access_Specifier::none;
    bool is_definition = false;
    bool is_in_system_header = false;
    bool is_implicit = false;
    bool is_static = false;
    bool is_const = false;
    bool is_virtual = false;
    bool is_pure_virtual = false;
    std::vector<Entity> children;
};

struct AST_Load_Error {
    /// @brief The AST dump which could not be loaded.
    std::u8string file;
    std::u8string message;
};

/// @brief Converts a clang-style JSON AST dump (`clang -Xclang -ast-dump=json`) into an `Entity`
/// tree rooted at a `translation_unit`.
/// Declarations that are only containers for other declarations,
/// such as `extern "C"` blocks and templates,
/// are transparent: their contents are hoisted into the enclosing entity.
/// @param source The JSON text.
/// @param memory Scratch memory, released when this function returns.
[[nodiscard]]
Result<Entity, AST_Load_Error> load_ast(std::u8string_view source, std::pmr::memory_resource* memory);

/// @brief Like `load_ast`, but reads the dump from the file at `path` first.
[[nodiscard]]
Result<Entity, AST_Load_Error>
load_ast_file(const std::filesystem::path& path, std::pmr::memory_resource* memory);

} // namespace lantern::ast

#endif
