// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/log.hpp>
#include <geminimcp/router.hpp>

namespace geminimcp
{

// =============================================================================
// Static Catalogs
// =============================================================================

json default_resource_catalog()
{
    return json::array({
        {{"uri", "gemini://models"},
         {"name", "Available Gemini Models"},
         {"description", "List of all available Gemini models and their capabilities"},
         {"mimeType", "application/json"}},
        {{"uri", "gemini://capabilities"},
         {"name", "API Capabilities"},
         {"description", "Detailed information about Gemini API capabilities"},
         {"mimeType", "text/markdown"}},
    });
}

json default_prompt_catalog()
{
    auto argument = [](const char* name, const char* description, bool required)
    { return json{{"name", name}, {"description", description}, {"required", required}}; };

    return json::array({
        {{"name", "code_review"},
         {"description", "Comprehensive code review with Gemini 2.5 Pro"},
         {"arguments",
          json::array({argument("code", "Code to review", true), argument("language", "Programming language", false)})}},
        {{"name", "explain_with_thinking"},
         {"description", "Deep explanation using Gemini 2.5 thinking capabilities"},
         {"arguments",
          json::array({
              argument("topic", "Topic to explain", true),
              argument("level", "Explanation level (beginner/intermediate/expert)", false),
          })}},
        {{"name", "creative_writing"},
         {"description", "Creative writing with style control"},
         {"arguments",
          json::array({
              argument("prompt", "Writing prompt", true),
              argument("style", "Writing style", false),
              argument("length", "Desired length", false),
          })}},
    });
}

// =============================================================================
// Router
// =============================================================================

Router::Router(const ToolRegistry& tools, ServerInfo info) : tools_(tools), info_(std::move(info))
{
    add_method("initialize", [this](const json&) { return handle_initialize(); });
    add_method("tools/list", [this](const json& params) { return handle_tools_list(params); });
    add_method("tools/call", [this](const json& params) { return handle_tools_call(params); }, true);
    add_method("resources/list", [](const json&) { return json{{"resources", default_resource_catalog()}}; });
    add_method("prompts/list", [](const json&) { return json{{"prompts", default_prompt_catalog()}}; });
}

void Router::add_method(const std::string& method, MethodHandler handler, bool long_running)
{
    methods_[method] = MethodEntry{std::move(handler), long_running};
}

bool Router::has_method(const std::string& method) const
{
    return methods_.count(method) > 0;
}

bool Router::is_long_running(const std::string& method) const
{
    auto it = methods_.find(method);
    return it != methods_.end() && it->second.long_running;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcRequest& request) const
{
    auto it = methods_.find(request.method);
    if (it == methods_.end())
    {
        if (request.is_notification())
        {
            logger()->debug("Notification received: {}", request.method);
            return std::nullopt;
        }
        return JsonRpcResponse::failure(
            *request.id, JsonRpcErrorCode::MethodNotFound, "Method not found: " + request.method
        );
    }

    logger()->debug("Handling request: {}", request.method);
    std::optional<JsonRpcErrorObject> error;
    json result;
    try
    {
        result = it->second.handler(request.params);
    }
    catch (const JsonRpcError& e)
    {
        error = JsonRpcErrorObject{static_cast<int>(e.code()), e.what(), e.data()};
    }
    catch (const std::exception& e)
    {
        error = JsonRpcErrorObject{static_cast<int>(JsonRpcErrorCode::InternalError), e.what(), nullptr};
    }
    catch (...)
    {
        error = JsonRpcErrorObject{static_cast<int>(JsonRpcErrorCode::InternalError), "Internal error", nullptr};
    }

    if (error)
        logger()->warn("{} failed: {}", request.method, error->message);

    if (request.is_notification())
        return std::nullopt;
    if (error)
        return JsonRpcResponse::failure(*request.id, std::move(*error));
    return JsonRpcResponse::success(*request.id, std::move(result));
}

// =============================================================================
// Built-in Methods
// =============================================================================

json Router::handle_initialize() const
{
    return json{
        {"protocolVersion", kMcpProtocolVersion},
        {"serverInfo", info_},
        {"capabilities", {{"tools", json::object()}, {"resources", json::object()}, {"prompts", json::object()}}},
    };
}

json Router::handle_tools_list(const json& params) const
{
    // Optional "tag" narrows the listing to tools carrying that capability tag
    if (params.is_object() && params.contains("tag"))
    {
        if (!params.at("tag").is_string())
            throw JsonRpcError(JsonRpcErrorCode::InvalidParams, "tools/list 'tag' must be a string");
        return json{{"tools", tools_.list_tagged(params.at("tag").get<std::string>())}};
    }
    return json{{"tools", tools_.list()}};
}

json Router::handle_tools_call(const json& params) const
{
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string())
        throw JsonRpcError(JsonRpcErrorCode::InternalError, "tools/call requires a string 'name'");

    auto name = params.at("name").get<std::string>();
    json arguments = params.contains("arguments") ? params.at("arguments") : json::object();
    return tools_.call(name, arguments);
}

} // namespace geminimcp
