// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tools.hpp
/// @brief The built-in tools: generate, vision-analyze, token-count, list-models, embed

#include <geminimcp/conversation_store.hpp>
#include <geminimcp/gateway.hpp>
#include <geminimcp/model_catalog.hpp>
#include <geminimcp/tool_registry.hpp>

#include <string>

namespace geminimcp
{

inline constexpr const char* kGenerateTool = "generate";
inline constexpr const char* kVisionAnalyzeTool = "vision-analyze";
inline constexpr const char* kTokenCountTool = "token-count";
inline constexpr const char* kListModelsTool = "list-models";
inline constexpr const char* kEmbedTool = "embed";

inline constexpr const char* kDefaultModel = "gemini-2.5-flash";
inline constexpr const char* kDefaultEmbeddingModel = "text-embedding-004";
inline constexpr const char* kDefaultImageMimeType = "image/jpeg";

/// Collaborators shared by the built-in tool handlers
///
/// The referenced objects must outlive the registry the tools are added to.
struct ToolContext
{
    ModelGateway& gateway;
    IConversationStore& conversations;
    const ModelCatalog& catalog;
    std::string default_model = kDefaultModel;
    std::string default_embedding_model = kDefaultEmbeddingModel;
};

/// Register all five built-in tools
void register_builtin_tools(ToolRegistry& registry, const ToolContext& context);

/// Inline image payload split into MIME type and base64 data
struct ImageData
{
    std::string mime_type;
    std::string data;
};

/// Split `data:<mime>;base64,<payload>`; anything else is taken as a bare
/// base64 payload of type kDefaultImageMimeType
ImageData parse_image_data(const std::string& value);

} // namespace geminimcp
