#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lantern/util/io.hpp"
#include "lantern/util/result.hpp"
#include "lantern/util/strings.hpp"

#include "lantern/ast.hpp"
#include "lantern/json.hpp"

namespace lantern::ast {
namespace {

enum struct Node_Treatment : Default_Underlying {
    /// @brief The node becomes an entity.
    entity,
    /// @brief The node's children are hoisted into the parent.
    transparent,
};

struct Node_Kind_Info {
    Entity_Kind kind;
    Node_Treatment treatment;
};

[[nodiscard]]
Node_Kind_Info classify(std::u8string_view kind, const json::Object& node)
{
    if (kind == u8"TranslationUnitDecl") {
        return { Entity_Kind::translation_unit, Node_Treatment::entity };
    }
    if (kind == u8"NamespaceDecl") {
        return { Entity_Kind::namespace_decl, Node_Treatment::entity };
    }
    if (kind == u8"CXXRecordDecl" || kind == u8"RecordDecl") {
        const json::String* const tag = node.find_string(u8"tagUsed");
        if (tag && *tag == u8"class") {
            return { Entity_Kind::class_decl, Node_Treatment::entity };
        }
        if (tag && *tag == u8"struct") {
            return { Entity_Kind::struct_decl, Node_Treatment::entity };
        }
        return { Entity_Kind::other, Node_Treatment::entity };
    }
    if (kind == u8"FunctionDecl") {
        return { Entity_Kind::function_decl, Node_Treatment::entity };
    }
    if (kind == u8"CXXMethodDecl") {
        return { Entity_Kind::method_decl, Node_Treatment::entity };
    }
    if (kind == u8"FieldDecl") {
        return { Entity_Kind::field_decl, Node_Treatment::entity };
    }
    if (kind == u8"ParmVarDecl") {
        return { Entity_Kind::param_decl, Node_Treatment::entity };
    }
    if (kind == u8"LinkageSpecDecl" || kind == u8"ExportDecl" || kind == u8"ClassTemplateDecl"
        || kind == u8"FunctionTemplateDecl") {
        return { Entity_Kind::other, Node_Treatment::transparent };
    }
    return { Entity_Kind::other, Node_Treatment::entity };
}

[[nodiscard]]
Access_Specifier parse_access(const json::String* access)
{
    if (!access) {
        return Access_Specifier::none;
    }
    if (*access == u8"public") {
        return Access_Specifier::public_;
    }
    if (*access == u8"protected") {
        return Access_Specifier::protected_;
    }
    if (*access == u8"private") {
        return Access_Specifier::private_;
    }
    return Access_Specifier::none;
}

[[nodiscard]]
bool find_flag(const json::Object& node, std::u8string_view key)
{
    const bool* const result = node.find_bool(key);
    return result && *result;
}

/// @brief The return type of a function type spelling like `int (float, char) const`.
[[nodiscard]]
std::u8string_view return_type_of(std::u8string_view function_type)
{
    const std::size_t paren = function_type.find(u8'(');
    return trim_ascii_blank(function_type.substr(0, paren));
}

[[nodiscard]]
bool is_const_function_type(std::u8string_view function_type)
{
    const std::size_t paren = function_type.rfind(u8')');
    if (paren == std::u8string_view::npos) {
        return false;
    }
    const std::u8string_view qualifiers = function_type.substr(paren + 1);
    return qualifiers.contains(u8"const");
}

/// @brief Returns `true` if the function declaration `node` has a body.
[[nodiscard]]
bool has_body(const json::Object& node)
{
    const json::Array* const inner = node.find_array(u8"inner");
    if (!inner) {
        return false;
    }
    return std::ranges::any_of(*inner, [](const json::Value& child) {
        const json::Object* const object = child.as_object();
        const json::String* const kind = object ? object->find_string(u8"kind") : nullptr;
        return kind && *kind == u8"CompoundStmt";
    });
}

struct Loader {
    std::u8string_view dump_file;
    /// @brief Clang omits the file of a location when it is the same as in the previous location,
    /// so the most recently seen one is carried over.
    std::u8string current_file;

    [[nodiscard]]
    std::optional<std::size_t> read_source_position(const json::Object& position)
    {
        const json::Object* effective = &position;
        if (const json::Object* const expansion = position.find_object(u8"expansionLoc")) {
            if (const json::Object* const spelling = position.find_object(u8"spellingLoc")) {
                read_source_position(*spelling);
            }
            effective = expansion;
        }
        if (const json::String* const file = effective->find_string(u8"file")) {
            current_file = *file;
        }
        const json::Number* const offset = effective->find_number(u8"offset");
        if (!offset) {
            return {};
        }
        auto result = static_cast<std::size_t>(*offset);
        if (const json::Number* const token_length = effective->find_number(u8"tokLen")) {
            result += static_cast<std::size_t>(*token_length);
        }
        return result;
    }

    [[nodiscard]]
    std::optional<Location> read_location(const json::Object& node)
    {
        std::optional<std::size_t> begin;
        std::optional<std::size_t> end;
        if (const json::Object* const loc = node.find_object(u8"loc")) {
            (void)read_source_position(*loc);
        }
        if (const json::Object* const range = node.find_object(u8"range")) {
            if (const json::Object* const range_begin = range->find_object(u8"begin")) {
                if (const json::Number* const offset = range_begin->find_number(u8"offset")) {
                    begin = static_cast<std::size_t>(*offset);
                }
                if (const json::String* const file = range_begin->find_string(u8"file")) {
                    current_file = *file;
                }
            }
            if (const json::Object* const range_end = range->find_object(u8"end")) {
                end = read_source_position(*range_end);
            }
        }
        if (current_file.empty() || !begin) {
            return {};
        }
        return Location { .file = current_file, .begin = *begin, .end = end.value_or(*begin) };
    }

    [[nodiscard]]
    Result<void, AST_Load_Error> load_children(Entity& parent, const json::Object& node)
    {
        const json::Array* const inner = node.find_array(u8"inner");
        if (!inner) {
            return {};
        }
        for (const json::Value& child : *inner) {
            const json::Object* const child_object = child.as_object();
            if (!child_object) {
                return error(u8"An element of \"inner\" is not an object.");
            }
            if (auto r = load_node(parent, *child_object); !r) {
                return r;
            }
        }
        return {};
    }

    [[nodiscard]]
    Result<void, AST_Load_Error> load_node(Entity& parent, const json::Object& node)
    {
        const json::String* const kind_string = node.find_string(u8"kind");
        if (!kind_string) {
            return error(u8"An AST node has no \"kind\".");
        }
        const Node_Kind_Info info = classify(*kind_string, node);
        if (info.treatment == Node_Treatment::transparent) {
            (void)read_location(node);
            return load_children(parent, node);
        }

        Entity entity { .kind = info.kind };
        if (auto r = load_entity(entity, node); !r) {
            return r;
        }
        parent.children.push_back(std::move(entity));
        return {};
    }

    [[nodiscard]]
    Result<void, AST_Load_Error> load_entity(Entity& entity, const json::Object& node)
    {
        if (const json::String* const id = node.find_string(u8"id")) {
            entity.id = *id;
        }
        if (const json::String* const name = node.find_string(u8"name")) {
            entity.name = *name;
        }
        entity.location = read_location(node);
        if (const json::String* const comment = node.find_string(u8"rawComment")) {
            entity.raw_comment = std::u8string { *comment };
        }
        entity.access = parse_access(node.find_string(u8"access"));
        entity.is_implicit = find_flag(node, u8"isImplicit");
        entity.is_in_system_header = find_flag(node, u8"isInSystemHeader");
        if (const json::Object* const loc = node.find_object(u8"loc")) {
            entity.is_in_system_header |= find_flag(*loc, u8"isInSystemHeader");
        }
        entity.is_virtual = find_flag(node, u8"virtual");
        entity.is_pure_virtual = find_flag(node, u8"pure");
        if (const json::String* const storage = node.find_string(u8"storageClass")) {
            entity.is_static = *storage == u8"static";
        }
        if (const json::Object* const referenced = node.find_object(u8"referencedDecl")) {
            if (const json::String* const id = referenced->find_string(u8"id")) {
                entity.referenced_id = *id;
            }
        }

        const json::Object* const type_object = node.find_object(u8"type");
        const json::String* const qual_type
            = type_object ? type_object->find_string(u8"qualType") : nullptr;

        switch (entity.kind) {
        case Entity_Kind::class_decl:
        case Entity_Kind::struct_decl: {
            entity.is_definition = find_flag(node, u8"completeDefinition");
            break;
        }
        case Entity_Kind::function_decl:
        case Entity_Kind::method_decl: {
            if (qual_type) {
                entity.type = return_type_of(*qual_type);
                entity.is_const = is_const_function_type(*qual_type);
            }
            entity.is_definition = has_body(node);
            break;
        }
        case Entity_Kind::field_decl:
        case Entity_Kind::param_decl: {
            if (qual_type) {
                entity.type = *qual_type;
            }
            break;
        }
        default: break;
        }

        return load_children(entity, node);
    }

    [[nodiscard]]
    AST_Load_Error error(std::u8string_view message) const
    {
        return AST_Load_Error { .file = std::u8string { dump_file },
                                .message = std::u8string { message } };
    }
};

[[nodiscard]]
Result<Entity, AST_Load_Error>
load_ast_impl(std::u8string_view source, std::u8string_view file, std::pmr::memory_resource* memory)
{
    Loader loader { .dump_file = file, .current_file = {} };

    std::optional<json::Value> root = json::load(source, memory);
    if (!root) {
        return loader.error(u8"The AST dump is not valid JSON.");
    }
    const json::Object* const root_object = root->as_object();
    if (!root_object) {
        return loader.error(u8"The AST dump is not a JSON object.");
    }
    const json::String* const kind = root_object->find_string(u8"kind");
    if (!kind || *kind != u8"TranslationUnitDecl") {
        return loader.error(u8"The root of the AST dump is not a TranslationUnitDecl.");
    }

    Entity result { .kind = Entity_Kind::translation_unit };
    if (auto r = loader.load_children(result, *root_object); !r) {
        return r.error();
    }
    return result;
}

} // namespace

Result<Entity, AST_Load_Error> load_ast(std::u8string_view source, std::pmr::memory_resource* memory)
{
    return load_ast_impl(source, {}, memory);
}

Result<Entity, AST_Load_Error>
load_ast_file(const std::filesystem::path& path, std::pmr::memory_resource* memory)
{
    const std::u8string file_name = path.generic_u8string();
    Result<std::pmr::vector<char8_t>, IO_Error_Code> source = load_utf8_file(path, memory);
    if (!source) {
        return AST_Load_Error { .file = file_name,
                                .message = std::u8string { io_error_code_message(source.error()) } };
    }
    return load_ast_impl(as_u8string_view(*source), file_name, memory);
}

} // namespace lantern::ast
