// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/schema.hpp>
#include <geminimcp/types.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Tool Types
// =============================================================================

/// Advertised shape of one tool
struct ToolDescriptor
{
    std::string name;
    std::string description;
    ObjectSchema input_schema;
    /// Capability tags (e.g. "generation", "vision"); not sent on the wire
    std::vector<std::string> tags;

    bool has_tag(const std::string& tag) const;
};

/// Serialized as an MCP tool: `{name, description, inputSchema}`
void to_json(json& j, const ToolDescriptor& t);

/// Tool handler; receives arguments already validated, with defaults applied
using ToolHandler = std::function<ToolResult(const json& arguments)>;

// =============================================================================
// ToolRegistry
// =============================================================================

/// Catalog of invocable tools
///
/// Filled once at startup and only read afterwards, so concurrent calls need
/// no locking.
class ToolRegistry
{
  public:
    /// Register a tool
    /// @throws std::invalid_argument if the name is already taken
    void add(ToolDescriptor descriptor, ToolHandler handler);

    /// All descriptors in registration order
    std::vector<ToolDescriptor> list() const;

    /// Descriptors carrying `tag`
    std::vector<ToolDescriptor> list_tagged(const std::string& tag) const;

    /// @return nullptr when no tool has that name
    const ToolDescriptor* find(const std::string& name) const;

    /// Validate `arguments` against the tool's schema and run its handler
    /// @throws JsonRpcError(InternalError) for an unknown tool or invalid arguments
    ToolResult call(const std::string& name, const json& arguments) const;

    size_t size() const
    {
        return order_.size();
    }

  private:
    struct Entry
    {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    std::map<std::string, Entry> tools_;
    std::vector<std::string> order_;
};

} // namespace geminimcp
