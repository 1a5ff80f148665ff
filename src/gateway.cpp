// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/gateway.hpp>
#include <geminimcp/log.hpp>

namespace geminimcp
{

namespace
{

/// Raise a ProviderError when the provider answered with an error object
void throw_if_error(const json& response)
{
    if (!response.is_object())
        throw ProviderError("Provider returned a non-object response");

    auto it = response.find("error");
    if (it == response.end())
        return;

    const json& error = *it;
    std::string message = "Provider error";
    long status = 0;
    if (error.is_object())
    {
        if (error.contains("message") && error["message"].is_string())
            message = error["message"].get<std::string>();
        if (error.contains("code") && error["code"].is_number_integer())
            status = error["code"].get<long>();
    }
    else if (error.is_string())
    {
        message = error.get<std::string>();
    }
    throw ProviderError(message, status);
}

json user_text_contents(const std::string& text)
{
    return json::array({ConversationTurn::text(Role::User, text)});
}

} // namespace

// =============================================================================
// Request Translation
// =============================================================================

json ModelGateway::build_generate_body(const GenerateRequest& request)
{
    json body = {{"contents", request.contents}};

    const auto& c = request.config;
    json generation_config = json::object();
    if (c.temperature)
        generation_config["temperature"] = *c.temperature;
    if (c.max_output_tokens)
        generation_config["maxOutputTokens"] = *c.max_output_tokens;
    if (c.top_k)
        generation_config["topK"] = *c.top_k;
    if (c.top_p)
        generation_config["topP"] = *c.top_p;
    if (c.response_mime_type)
        generation_config["responseMimeType"] = *c.response_mime_type;
    if (c.response_schema)
        generation_config["responseSchema"] = *c.response_schema;
    if (!generation_config.empty())
        body["generationConfig"] = generation_config;

    if (request.system_instruction)
        body["systemInstruction"] = {{"parts", json::array({json{{"text", *request.system_instruction}}})}};

    if (!request.safety_settings.empty())
    {
        json settings = json::array();
        for (const auto& s : request.safety_settings)
            settings.push_back({{"category", s.category}, {"threshold", s.threshold}});
        body["safetySettings"] = settings;
    }

    if (request.grounding)
        body["tools"] = json::array({json{{"googleSearch", json::object()}}});

    return body;
}

// =============================================================================
// Response Normalization
// =============================================================================

GenerateResult ModelGateway::parse_generate_response(const std::string& model, const json& response)
{
    throw_if_error(response);

    GenerateResult result;
    result.model = model;

    const json candidates = response.value("candidates", json::array());
    if (candidates.empty())
    {
        if (response.contains("promptFeedback") && response["promptFeedback"].contains("blockReason"))
        {
            throw ProviderError(
                "Prompt blocked by provider: " +
                response["promptFeedback"]["blockReason"].get<std::string>()
            );
        }
    }
    else
    {
        const json& first = candidates.at(0);
        if (first.contains("content") && first["content"].contains("parts"))
        {
            for (const auto& part : first["content"]["parts"])
            {
                // Reasoning summaries are not part of the answer
                if (part.value("thought", false))
                    continue;
                if (part.contains("text") && part["text"].is_string())
                    result.text += part["text"].get<std::string>();
            }
        }
        if (first.contains("finishReason") && first["finishReason"].is_string())
            result.finish_reason = first["finishReason"].get<std::string>();
    }
    result.candidates_count = static_cast<int64_t>(candidates.size());

    if (response.contains("usageMetadata"))
    {
        const json& usage = response["usageMetadata"];
        if (usage.contains("promptTokenCount"))
            result.usage.prompt_tokens = usage["promptTokenCount"].get<int64_t>();
        if (usage.contains("candidatesTokenCount"))
            result.usage.candidates_tokens = usage["candidatesTokenCount"].get<int64_t>();
        if (usage.contains("totalTokenCount"))
            result.usage.total_tokens = usage["totalTokenCount"].get<int64_t>();
    }

    return result;
}

// =============================================================================
// Calls
// =============================================================================

GenerateResult ModelGateway::generate(const GenerateRequest& request)
{
    logger()->debug("generateContent model={} turns={}", request.model, request.contents.size());
    auto response = client_.generate_content(request.model, build_generate_body(request));
    return parse_generate_response(request.model, response);
}

TokenCountResult ModelGateway::count_tokens(const std::string& model, const std::string& text)
{
    auto response = client_.count_tokens(model, json{{"contents", user_text_contents(text)}});
    throw_if_error(response);

    if (!response.contains("totalTokens") || !response["totalTokens"].is_number_integer())
        throw ProviderError("Provider response is missing totalTokens");

    return TokenCountResult{model, response["totalTokens"].get<int64_t>()};
}

EmbeddingResult ModelGateway::embed(const std::string& model, const std::string& text)
{
    json body = {{"content", {{"parts", json::array({json{{"text", text}}})}}}};
    auto response = client_.embed_content(model, body);
    throw_if_error(response);

    // embedContent answers with `embedding`; batch endpoints use `embeddings`
    const json* values = nullptr;
    if (response.contains("embedding") && response["embedding"].contains("values"))
        values = &response["embedding"]["values"];
    else if (response.contains("embeddings") && !response["embeddings"].empty() &&
             response["embeddings"][0].contains("values"))
        values = &response["embeddings"][0]["values"];

    if (!values || !values->is_array())
        throw ProviderError("Provider response is missing embedding values");

    return EmbeddingResult{model, values->get<std::vector<double>>()};
}

} // namespace geminimcp
