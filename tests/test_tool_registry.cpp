// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/jsonrpc.hpp>
#include <geminimcp/tool_registry.hpp>
#include <gtest/gtest.h>

using namespace geminimcp;

namespace
{

ToolDescriptor echo_descriptor()
{
    return ToolDescriptor{
        "echo",
        "Echo the message back",
        SchemaBuilder()
            .property("message", ValueType::String, "Message")
            .required()
            .property("times", ValueType::Integer, "Repeat count")
            .default_value(1)
            .build(),
        {"testing"}
    };
}

ToolResult echo(const json& args)
{
    std::string out;
    for (int64_t i = 0; i < args.at("times").get<int64_t>(); ++i)
        out += args.at("message").get<std::string>();
    return ToolResult{out, json{{"times", args.at("times")}}};
}

} // namespace

TEST(ToolRegistryTest, ListsInRegistrationOrder)
{
    ToolRegistry registry;
    registry.add(echo_descriptor(), echo);
    registry.add(ToolDescriptor{"zeta", "last", ObjectSchema{}, {}}, echo);
    registry.add(ToolDescriptor{"alpha", "first", ObjectSchema{}, {"testing"}}, echo);

    auto tools = registry.list();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[1].name, "zeta");
    EXPECT_EQ(tools[2].name, "alpha");
    EXPECT_EQ(registry.size(), 3u);
}

TEST(ToolRegistryTest, ListTaggedFiltersByTag)
{
    ToolRegistry registry;
    registry.add(echo_descriptor(), echo);
    registry.add(ToolDescriptor{"other", "untagged", ObjectSchema{}, {}}, echo);

    auto tagged = registry.list_tagged("testing");
    ASSERT_EQ(tagged.size(), 1u);
    EXPECT_EQ(tagged[0].name, "echo");
    EXPECT_TRUE(registry.list_tagged("missing").empty());
}

TEST(ToolRegistryTest, DuplicateNameThrows)
{
    ToolRegistry registry;
    registry.add(echo_descriptor(), echo);
    EXPECT_THROW(registry.add(echo_descriptor(), echo), std::invalid_argument);
}

TEST(ToolRegistryTest, DescriptorSerialization)
{
    json j = echo_descriptor();
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["description"], "Echo the message back");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_EQ(j["inputSchema"]["required"], json::array({"message"}));
    EXPECT_FALSE(j.contains("tags"));
}

TEST(ToolRegistryTest, CallPassesValidatedArguments)
{
    ToolRegistry registry;
    registry.add(echo_descriptor(), echo);

    auto result = registry.call("echo", json{{"message", "ab"}, {"times", 2}});
    EXPECT_EQ(result.text, "abab");

    auto defaulted = registry.call("echo", json{{"message", "x"}});
    EXPECT_EQ(defaulted.text, "x");
    EXPECT_EQ(defaulted.metadata["times"], 1);
}

TEST(ToolRegistryTest, CallUnknownTool)
{
    ToolRegistry registry;
    try
    {
        registry.call("nope", json::object());
        FAIL() << "expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::InternalError);
        EXPECT_STREQ(e.what(), "Unknown tool: nope");
    }
}

TEST(ToolRegistryTest, InvalidArgumentsNeverReachHandler)
{
    ToolRegistry registry;
    bool called = false;
    registry.add(
        echo_descriptor(),
        [&called](const json& args)
        {
            called = true;
            return echo(args);
        }
    );

    try
    {
        registry.call("echo", json{{"times", 2}});
        FAIL() << "expected JsonRpcError";
    }
    catch (const JsonRpcError& e)
    {
        EXPECT_EQ(e.code(), JsonRpcErrorCode::InternalError);
        EXPECT_STREQ(e.what(), "Missing required argument: message");
        EXPECT_EQ(e.data()["reason"], "missing_required");
        EXPECT_EQ(e.data()["field"], "message");
    }
    EXPECT_FALSE(called);
}

TEST(ToolRegistryTest, ToolResultSerialization)
{
    json j = ToolResult{"hello", json{{"model", "m"}}};
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][0]["text"], "hello");
    EXPECT_EQ(j["metadata"]["model"], "m");

    json bare = ToolResult{"x"};
    EXPECT_FALSE(bare.contains("metadata"));
}
