// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/jsonrpc.hpp>
#include <geminimcp/log.hpp>
#include <geminimcp/tool_registry.hpp>

#include <algorithm>
#include <stdexcept>

namespace geminimcp
{

bool ToolDescriptor::has_tag(const std::string& tag) const
{
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void to_json(json& j, const ToolDescriptor& t)
{
    j = json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void ToolRegistry::add(ToolDescriptor descriptor, ToolHandler handler)
{
    auto name = descriptor.name;
    if (tools_.count(name))
        throw std::invalid_argument("Tool already registered: " + name);

    tools_.emplace(name, Entry{std::move(descriptor), std::move(handler)});
    order_.push_back(std::move(name));
}

std::vector<ToolDescriptor> ToolRegistry::list() const
{
    std::vector<ToolDescriptor> out;
    out.reserve(order_.size());
    for (const auto& name : order_)
        out.push_back(tools_.at(name).descriptor);
    return out;
}

std::vector<ToolDescriptor> ToolRegistry::list_tagged(const std::string& tag) const
{
    std::vector<ToolDescriptor> out;
    for (const auto& name : order_)
    {
        const auto& descriptor = tools_.at(name).descriptor;
        if (descriptor.has_tag(tag))
            out.push_back(descriptor);
    }
    return out;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const
{
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second.descriptor;
}

ToolResult ToolRegistry::call(const std::string& name, const json& arguments) const
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        throw JsonRpcError(JsonRpcErrorCode::InternalError, "Unknown tool: " + name);

    auto outcome = validate(it->second.descriptor.input_schema, arguments);
    if (auto* failure = std::get_if<ValidationFailure>(&outcome))
    {
        logger()->debug("Rejected arguments for {}: {}", name, failure->message);
        throw JsonRpcError(JsonRpcErrorCode::InternalError, failure->message, json(*failure));
    }

    return it->second.handler(std::get<json>(outcome));
}

} // namespace geminimcp
