#include <charconv>
#include <cmath>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ulight/json.hpp"

#include "lantern/util/assert.hpp"
#include "lantern/util/url_encode.hpp"

#include "lantern/json.hpp"

namespace lantern::json {
namespace {

struct Building_Visitor final : ulight::JSON_Visitor {
    using Pos = ulight::Source_Position;

    std::pmr::memory_resource* memory;
    std::optional<json::Value> root_value;
    std::pmr::vector<json::Value> structure_stack;
    std::pmr::vector<std::pmr::u8string> property_stack;

    std::pmr::u8string current_string;

    explicit Building_Visitor(std::pmr::memory_resource* memory)
        : memory { memory }
        , structure_stack { memory }
        , property_stack { memory }
        , current_string { memory }
    {
    }

    void literal(const Pos&, std::u8string_view chars) final
    {
        current_string.append(chars);
    }

    void escape(const Pos&, std::u8string_view, char32_t, std::u8string_view code_units) final
    {
        current_string.append(code_units.begin(), code_units.end());
    }

    void number(const Pos&, std::u8string_view, double value) final
    {
        insert_value(value);
    }

    void null(const Pos&) final
    {
        insert_value(json::Null {});
    }
    void boolean(const Pos&, bool value) final
    {
        insert_value(value);
    }

    void push_string(const Pos&) final
    {
        current_string.clear();
    }
    void pop_string(const Pos&) final
    {
        insert_value(json::String { current_string, memory });
    }

    void push_property(const Pos&) final
    {
        current_string.clear();
    }
    void pop_property(const Pos&) final
    {
        property_stack.push_back(current_string);
    }

    void push_object(const Pos&) final
    {
        structure_stack.push_back(json::Object { memory });
    }
    void pop_object(const Pos&) final
    {
        json::Value object = std::move(structure_stack.back());
        structure_stack.pop_back();
        insert_value(std::move(object));
    }

    void push_array(const Pos&) final
    {
        structure_stack.push_back(json::Array { memory });
    }
    void pop_array(const Pos&) final
    {
        json::Value array = std::move(structure_stack.back());
        structure_stack.pop_back();
        insert_value(std::move(array));
    }

    void insert_value(json::Value&& value)
    {
        if (structure_stack.empty()) {
            root_value = std::move(value);
            LANTERN_ASSERT(property_stack.empty());
        }
        else if (auto* const array = std::get_if<json::Array>(&structure_stack.back())) {
            array->push_back(std::move(value));
        }
        else if (auto* const object = std::get_if<json::Object>(&structure_stack.back())) {
            LANTERN_ASSERT(!property_stack.empty());
            object->push_back({ json::String { property_stack.back(), memory }, std::move(value) });
            property_stack.pop_back();
        }
    }
};

struct Serializing_Visitor {
    std::pmr::u8string& out;

    void operator()(Null) const
    {
        out += u8"null";
    }

    void operator()(bool value) const
    {
        out += value ? u8"true" : u8"false";
    }

    void operator()(Number value) const
    {
        if (!std::isfinite(value)) {
            out += u8"null";
            return;
        }
        char buffer[32];
        const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
        LANTERN_ASSERT(result.ec == std::errc {});
        out.append(reinterpret_cast<const char8_t*>(buffer), std::size_t(result.ptr - buffer));
    }

    void operator()(const String& value) const
    {
        append_quoted(out, value);
    }

    void operator()(const Array& value) const
    {
        out += u8'[';
        bool first = true;
        for (const Value& element : value) {
            if (!first) {
                out += u8',';
            }
            first = false;
            serialize(out, element);
        }
        out += u8']';
    }

    void operator()(const Object& value) const
    {
        out += u8'{';
        bool first = true;
        for (const auto& [key, member_value] : value) {
            if (!first) {
                out += u8',';
            }
            first = false;
            append_quoted(out, key);
            out += u8':';
            serialize(out, member_value);
        }
        out += u8'}';
    }
};

} // namespace

std::optional<json::Value> load(std::u8string_view source, std::pmr::memory_resource* memory)
{
    constexpr ulight::JSON_Options options { .allow_comments = true,
                                             .parse_numbers = true,
                                             .escapes = ulight::Escape_Parsing::parse_encode };
    Building_Visitor visitor { memory };
    if (!parse_json(visitor, source, options)) {
        return {};
    }
    return std::move(visitor.root_value);
}

void append_quoted(std::pmr::u8string& out, std::u8string_view str)
{
    out += u8'"';
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        default: {
            if (c < 0x20) {
                out += u8"\\u00";
                out += detail::to_ascii_digit((c >> 4) & 0xf);
                out += detail::to_ascii_digit(c & 0xf);
            }
            else {
                out += c;
            }
        }
        }
    }
    out += u8'"';
}

void serialize(std::pmr::u8string& out, const Value& value)
{
    std::visit(Serializing_Visitor { out }, static_cast<const Value_Variant&>(value));
}

} // namespace lantern::json
