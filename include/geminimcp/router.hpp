// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/jsonrpc.hpp>
#include <geminimcp/tool_registry.hpp>
#include <geminimcp/types.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace geminimcp
{

/// Handler for one JSON-RPC method; returns the result or throws
using MethodHandler = std::function<json(const json& params)>;

/// Static resource catalog answered by `resources/list`
json default_resource_catalog();

/// Static prompt catalog answered by `prompts/list`
json default_prompt_catalog();

/// Method→handler table and the error boundary of the server
///
/// dispatch() never throws: every failure beneath it becomes an error
/// response, and notifications never produce one.
class Router
{
  public:
    /// Registers initialize, tools/list, tools/call, resources/list and prompts/list
    /// @param tools Must outlive the router
    Router(const ToolRegistry& tools, ServerInfo info);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Add or replace a method
    /// @param long_running Ask the server to run it off the read loop
    void add_method(const std::string& method, MethodHandler handler, bool long_running = false);

    /// Route one request
    /// @return The response, or nullopt for a notification
    std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& request) const;

    bool has_method(const std::string& method) const;

    /// Whether the server should execute `method` on a detached task
    bool is_long_running(const std::string& method) const;

  private:
    json handle_initialize() const;
    json handle_tools_list(const json& params) const;
    json handle_tools_call(const json& params) const;

    struct MethodEntry
    {
        MethodHandler handler;
        bool long_running = false;
    };

    const ToolRegistry& tools_;
    ServerInfo info_;
    std::map<std::string, MethodEntry> methods_;
};

} // namespace geminimcp
