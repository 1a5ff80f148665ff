// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/log.hpp>
#include <geminimcp/tools.hpp>

#include <optional>

namespace geminimcp
{

namespace
{

const std::vector<json> kHarmCategories = {
    "HARM_CATEGORY_HARASSMENT",
    "HARM_CATEGORY_HATE_SPEECH",
    "HARM_CATEGORY_SEXUALLY_EXPLICIT",
    "HARM_CATEGORY_DANGEROUS_CONTENT",
};

const std::vector<json> kBlockThresholds = {
    "BLOCK_NONE",
    "BLOCK_ONLY_HIGH",
    "BLOCK_MEDIUM_AND_ABOVE",
    "BLOCK_LOW_AND_ABOVE",
};

std::optional<std::string> optional_string(const json& args, const char* name)
{
    if (args.contains(name))
        return args.at(name).get<std::string>();
    return std::nullopt;
}

json usage_total(const GenerateResult& result)
{
    return result.usage.total_tokens ? json(*result.usage.total_tokens) : json(nullptr);
}

// =============================================================================
// generate
// =============================================================================

ToolDescriptor generate_descriptor(const ToolContext& ctx)
{
    ObjectSchema safety = SchemaBuilder()
                              .property("category", ValueType::String, "Harm category")
                              .required()
                              .one_of(kHarmCategories)
                              .property("threshold", ValueType::String, "Blocking threshold")
                              .required()
                              .one_of(kBlockThresholds)
                              .build();

    auto schema =
        SchemaBuilder()
            .property("prompt", ValueType::String, "The prompt to send to Gemini")
            .required()
            .property("model", ValueType::String, "Specific Gemini model to use")
            .one_of(ModelCatalog::names(ctx.catalog.without(ModelCapability::Embedding)))
            .default_value(ctx.default_model)
            .property("systemInstruction", ValueType::String, "System instruction to guide model behavior")
            .property("temperature", ValueType::Number, "Temperature for generation (0-2)")
            .range(0.0, 2.0)
            .default_value(0.7)
            .property("maxTokens", ValueType::Integer, "Maximum tokens to generate")
            .range(1.0, std::nullopt)
            .default_value(2048)
            .property("topK", ValueType::Integer, "Top-k sampling parameter")
            .range(1.0, std::nullopt)
            .default_value(40)
            .property("topP", ValueType::Number, "Top-p (nucleus) sampling parameter")
            .range(0.0, 1.0)
            .default_value(0.95)
            .property("structuredOutput", ValueType::Boolean, "Return JSON instead of free text")
            .default_value(false)
            .property("outputSchema", ValueType::Object, "JSON schema for structured output")
            .property("grounding", ValueType::Boolean, "Enable Google Search grounding for up-to-date information")
            .default_value(false)
            .property("safetyThresholds", ValueType::Array, "Safety settings for content filtering")
            .items(safety)
            .property("sessionId", ValueType::String, "ID for maintaining conversation context")
            .build();

    return ToolDescriptor{
        kGenerateTool,
        "Generate text using Google Gemini with advanced features",
        std::move(schema),
        {"generation", "conversation"}
    };
}

ToolResult run_generate(const ToolContext& ctx, const json& args)
{
    GenerateRequest request;
    request.model = args.at("model").get<std::string>();
    request.system_instruction = optional_string(args, "systemInstruction");

    auto& config = request.config;
    config.temperature = args.at("temperature").get<double>();
    config.max_output_tokens = args.at("maxTokens").get<int64_t>();
    config.top_k = args.at("topK").get<int64_t>();
    config.top_p = args.at("topP").get<double>();
    if (args.at("structuredOutput").get<bool>())
    {
        config.response_mime_type = "application/json";
        if (args.contains("outputSchema"))
            config.response_schema = args.at("outputSchema");
    }

    if (args.contains("safetyThresholds"))
    {
        for (const auto& s : args.at("safetyThresholds"))
            request.safety_settings.push_back(
                {s.at("category").get<std::string>(), s.at("threshold").get<std::string>()}
            );
    }

    if (args.at("grounding").get<bool>())
    {
        const ModelInfo* info = ctx.catalog.find(request.model);
        if (info && info->supports(ModelCapability::Grounding))
            request.grounding = true;
        else
            logger()->info("Model {} does not support grounding; flag ignored", request.model);
    }

    auto user_turn = ConversationTurn::text(Role::User, args.at("prompt").get<std::string>());
    auto session_id = optional_string(args, "sessionId");

    GenerateResult generated;
    size_t history_length = 0;
    if (session_id)
    {
        // Held until the new turns are stored
        auto session_lock = ctx.conversations.lock_session(*session_id);

        request.contents = ctx.conversations.history(*session_id);
        request.contents.push_back(user_turn);
        generated = ctx.gateway.generate(request);

        ctx.conversations.append(*session_id, {user_turn, ConversationTurn::text(Role::Model, generated.text)});
        history_length = request.contents.size() + 1;
    }
    else
    {
        request.contents.push_back(user_turn);
        generated = ctx.gateway.generate(request);
    }

    ToolResult result;
    result.text = generated.text;
    result.metadata = {
        {"model", generated.model},
        {"tokensUsed", usage_total(generated)},
        {"candidatesCount", generated.candidates_count},
        {"finishReason", generated.finish_reason ? json(*generated.finish_reason) : json(nullptr)},
    };
    if (session_id)
    {
        result.metadata["sessionId"] = *session_id;
        result.metadata["historyLength"] = history_length;
    }
    return result;
}

// =============================================================================
// vision-analyze
// =============================================================================

ToolDescriptor vision_descriptor(const ToolContext& ctx)
{
    auto schema = SchemaBuilder()
                      .property("prompt", ValueType::String, "Question or instruction about the image")
                      .required()
                      .property("imageRef", ValueType::String, "URL of the image to analyze")
                      .property(
                          "imageData",
                          ValueType::String,
                          "Base64-encoded image data, optionally as a data: URI (alternative to imageRef)"
                      )
                      .property("model", ValueType::String, "Vision-capable Gemini model")
                      .one_of(ModelCatalog::names(ctx.catalog.with(ModelCapability::Vision)))
                      .default_value(ctx.default_model)
                      .exactly_one_of({"imageRef", "imageData"})
                      .build();

    return ToolDescriptor{
        kVisionAnalyzeTool,
        "Analyze images using Gemini vision capabilities",
        std::move(schema),
        {"generation", "vision"}
    };
}

ToolResult run_vision(const ToolContext& ctx, const json& args)
{
    ConversationTurn turn;
    turn.role = Role::User;
    turn.parts.push_back(TextPart{args.at("prompt").get<std::string>()});

    if (auto ref = optional_string(args, "imageRef"))
    {
        // Remote images are not fetched; the model only sees the reference
        turn.parts.push_back(TextPart{"[Image URL: " + *ref + "]"});
    }
    else
    {
        auto image = parse_image_data(args.at("imageData").get<std::string>());
        turn.parts.push_back(InlineDataPart{std::move(image.mime_type), std::move(image.data)});
    }

    GenerateRequest request;
    request.model = args.at("model").get<std::string>();
    request.contents.push_back(std::move(turn));
    auto generated = ctx.gateway.generate(request);

    ToolResult result;
    result.text = generated.text;
    result.metadata = {{"model", generated.model}, {"tokensUsed", usage_total(generated)}};
    return result;
}

// =============================================================================
// token-count
// =============================================================================

ToolDescriptor token_count_descriptor(const ToolContext& ctx)
{
    auto schema = SchemaBuilder()
                      .property("text", ValueType::String, "Text to count tokens for")
                      .required()
                      .property("model", ValueType::String, "Model to use for token counting")
                      .one_of(ModelCatalog::names(ctx.catalog.without(ModelCapability::Embedding)))
                      .default_value(ctx.default_model)
                      .build();

    return ToolDescriptor{
        kTokenCountTool, "Count tokens for a given text with a specific model", std::move(schema), {"tokens"}
    };
}

ToolResult run_token_count(const ToolContext& ctx, const json& args)
{
    auto counted = ctx.gateway.count_tokens(args.at("model").get<std::string>(), args.at("text").get<std::string>());

    ToolResult result;
    result.text = "Token count: " + std::to_string(counted.total_tokens);
    result.metadata = {{"tokenCount", counted.total_tokens}, {"model", counted.model}};
    return result;
}

// =============================================================================
// list-models
// =============================================================================

ToolDescriptor list_models_descriptor()
{
    auto schema = SchemaBuilder()
                      .property(
                          "filter",
                          ValueType::String,
                          std::string("Filter models by capability: ") + kFilterAll + ", " +
                              kFilterStructuredOutput + ", " + kFilterGrounding + ", " +
                              kFilterExtendedReasoning + ", " + kFilterVision
                      )
                      .default_value(kFilterAll)
                      .build();

    return ToolDescriptor{
        kListModelsTool, "List all available Gemini models and their capabilities", std::move(schema), {"catalog"}
    };
}

ToolResult run_list_models(const ToolContext& ctx, const json& args)
{
    auto filter = args.at("filter").get<std::string>();
    auto models = ctx.catalog.filter(filter);

    ToolResult result;
    result.text = json(models).dump(2);
    result.metadata = {{"count", models.size()}, {"filter", filter}};
    return result;
}

// =============================================================================
// embed
// =============================================================================

ToolDescriptor embed_descriptor(const ToolContext& ctx)
{
    auto schema = SchemaBuilder()
                      .property("text", ValueType::String, "Text to generate embeddings for")
                      .required()
                      .property("model", ValueType::String, "Embedding model to use")
                      .one_of(ModelCatalog::names(ctx.catalog.with(ModelCapability::Embedding)))
                      .default_value(ctx.default_embedding_model)
                      .build();

    return ToolDescriptor{
        kEmbedTool, "Generate embeddings for text using Gemini embedding models", std::move(schema), {"embedding"}
    };
}

ToolResult run_embed(const ToolContext& ctx, const json& args)
{
    auto embedding = ctx.gateway.embed(args.at("model").get<std::string>(), args.at("text").get<std::string>());

    ToolResult result;
    result.text = json{{"embedding", embedding.values}, {"model", embedding.model}}.dump();
    result.metadata = {{"model", embedding.model}, {"dimensions", embedding.values.size()}};
    return result;
}

} // namespace

ImageData parse_image_data(const std::string& value)
{
    const std::string scheme = "data:";
    const std::string marker = ";base64,";

    if (value.compare(0, scheme.size(), scheme) == 0)
    {
        size_t marker_pos = value.find(marker, scheme.size());
        if (marker_pos != std::string::npos && marker_pos > scheme.size() &&
            marker_pos + marker.size() < value.size())
        {
            return ImageData{
                value.substr(scheme.size(), marker_pos - scheme.size()),
                value.substr(marker_pos + marker.size())
            };
        }
    }
    return ImageData{kDefaultImageMimeType, value};
}

void register_builtin_tools(ToolRegistry& registry, const ToolContext& context)
{
    registry.add(generate_descriptor(context), [context](const json& args) { return run_generate(context, args); });
    registry.add(vision_descriptor(context), [context](const json& args) { return run_vision(context, args); });
    registry.add(
        token_count_descriptor(context), [context](const json& args) { return run_token_count(context, args); }
    );
    registry.add(list_models_descriptor(), [context](const json& args) { return run_list_models(context, args); });
    registry.add(embed_descriptor(context), [context](const json& args) { return run_embed(context, args); });
}

} // namespace geminimcp
