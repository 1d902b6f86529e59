#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "lantern/json.hpp"

using namespace std::string_view_literals;

namespace lantern::json {
namespace {

TEST(JSON, load)
{
    std::pmr::monotonic_buffer_resource memory;
    const std::optional<Value> value = load(
        u8R"({
            // The project.
            "name": "lantern",
            "version": 1,
            "tags": [true, null, "xA"]
        })",
        &memory
    );
    ASSERT_TRUE(value);
    const Object* const object = value->as_object();
    ASSERT_NE(object, nullptr);
    ASSERT_EQ(object->size(), 3);

    const String* const name = object->find_string(u8"name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(*name, u8"lantern"sv);

    const Number* const version = object->find_number(u8"version");
    ASSERT_NE(version, nullptr);
    EXPECT_EQ(*version, 1.0);

    const Array* const tags = object->find_array(u8"tags");
    ASSERT_NE(tags, nullptr);
    ASSERT_EQ(tags->size(), 3);
    EXPECT_TRUE((*tags)[0].as_boolean());
    EXPECT_TRUE((*tags)[1].as_null());
    ASSERT_TRUE((*tags)[2].as_string());
    EXPECT_EQ(*(*tags)[2].as_string(), u8"xA"sv);

    EXPECT_EQ(object->find_string(u8"version"), nullptr);
    EXPECT_EQ(object->find_value(u8"missing"), nullptr);
}

TEST(JSON, load_invalid)
{
    std::pmr::monotonic_buffer_resource memory;
    EXPECT_FALSE(load(u8"{\"a\":", &memory));
    EXPECT_FALSE(load(u8"[1,,2]", &memory));
}

TEST(JSON, append_quoted)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    append_quoted(out, u8"say \"hi\"\\\n\x01");
    EXPECT_EQ(out, u8R"("say \"hi\"\\\n\u0001")"sv);
}

TEST(JSON, serialize)
{
    std::pmr::monotonic_buffer_resource memory;
    const std::optional<Value> value
        = load(u8R"({ "a": [1, 2.5, false], "b": { "c": null }, "d": "e" })", &memory);
    ASSERT_TRUE(value);

    std::pmr::u8string out { &memory };
    serialize(out, *value);
    EXPECT_EQ(out, u8R"({"a":[1,2.5,false],"b":{"c":null},"d":"e"})"sv);
}

} // namespace
} // namespace lantern::json
