// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// MCP protocol revision announced by `initialize`
inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

/// Name announced in `serverInfo`
inline constexpr const char* kServerName = "gemini-mcp-cpp";

// =============================================================================
// Conversation Types
// =============================================================================

/// Author of a conversation turn
enum class Role
{
    User,
    Model
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    Role,
    {
        {Role::User, "user"},
        {Role::Model, "model"},
    }
)

/// Plain text fragment of a turn
struct TextPart
{
    std::string text;
};

/// Base64 payload with its MIME type (e.g. an image)
struct InlineDataPart
{
    std::string mime_type;
    std::string data;
};

/// One fragment of a turn
using ContentPart = std::variant<TextPart, InlineDataPart>;

inline void to_json(json& j, const ContentPart& part)
{
    if (const auto* text = std::get_if<TextPart>(&part))
        j = json{{"text", text->text}};
    else
    {
        const auto& inline_data = std::get<InlineDataPart>(part);
        j = json{{"inlineData", {{"mimeType", inline_data.mime_type}, {"data", inline_data.data}}}};
    }
}

inline void from_json(const json& j, ContentPart& part)
{
    if (j.contains("inlineData"))
    {
        const auto& d = j.at("inlineData");
        part = InlineDataPart{d.at("mimeType").get<std::string>(), d.at("data").get<std::string>()};
    }
    else
    {
        part = TextPart{j.at("text").get<std::string>()};
    }
}

/// A single exchange step in a conversation
struct ConversationTurn
{
    Role role = Role::User;
    std::vector<ContentPart> parts;

    /// Convenience constructor for a text-only turn
    static ConversationTurn text(Role role, std::string text)
    {
        ConversationTurn turn;
        turn.role = role;
        turn.parts.push_back(TextPart{std::move(text)});
        return turn;
    }
};

inline void to_json(json& j, const ConversationTurn& t)
{
    j = json{{"role", t.role}, {"parts", t.parts}};
}

inline void from_json(const json& j, ConversationTurn& t)
{
    j.at("role").get_to(t.role);
    t.parts = j.at("parts").get<std::vector<ContentPart>>();
}

// =============================================================================
// Tool Result Types
// =============================================================================

/// Result returned by a tool handler
///
/// Serialized as `{"content":[{"type":"text","text":...}],"metadata":{...}}`.
struct ToolResult
{
    std::string text;
    json metadata = json::object();
};

inline void to_json(json& j, const ToolResult& r)
{
    j = json{{"content", json::array({json{{"type", "text"}, {"text", r.text}}})}};
    if (!r.metadata.empty())
        j["metadata"] = r.metadata;
}

// =============================================================================
// Server Info
// =============================================================================

/// Identity announced during `initialize`
struct ServerInfo
{
    std::string name = kServerName;
    std::string version;
};

inline void to_json(json& j, const ServerInfo& s)
{
    j = json{{"name", s.name}, {"version", s.version}};
}

} // namespace geminimcp
