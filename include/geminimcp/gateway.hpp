// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file gateway.hpp
/// @brief Translation between tool-level call shapes and provider requests

#include <geminimcp/types.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Provider Interface
// =============================================================================

/// Exception thrown when the provider call fails
class ProviderError : public std::runtime_error
{
  public:
    explicit ProviderError(const std::string& message, long status = 0)
        : std::runtime_error(message), status_(status)
    {
    }

    /// HTTP status, or 0 when the request never got a response
    long status() const
    {
        return status_;
    }

  private:
    long status_;
};

/// Black-box provider client
///
/// Each call takes the model name and a request body in the provider's JSON
/// shape and returns the provider's JSON response. Implementations must be
/// safe to call from several threads at once.
class IProviderClient
{
  public:
    virtual ~IProviderClient() = default;

    /// @throws ProviderError on transport or HTTP failure
    virtual json generate_content(const std::string& model, const json& body) = 0;
    virtual json count_tokens(const std::string& model, const json& body) = 0;
    virtual json embed_content(const std::string& model, const json& body) = 0;
};

// =============================================================================
// Gateway Types
// =============================================================================

/// Sampling and output controls
struct GenerationConfig
{
    std::optional<double> temperature;
    std::optional<int64_t> max_output_tokens;
    std::optional<int64_t> top_k;
    std::optional<double> top_p;
    std::optional<std::string> response_mime_type;
    std::optional<json> response_schema;
};

/// One content-safety threshold
struct SafetySetting
{
    std::string category;
    std::string threshold;
};

/// Normalized generation request
struct GenerateRequest
{
    std::string model;
    std::vector<ConversationTurn> contents;
    std::optional<std::string> system_instruction;
    GenerationConfig config;
    std::vector<SafetySetting> safety_settings;
    bool grounding = false;
};

struct UsageMetadata
{
    std::optional<int64_t> prompt_tokens;
    std::optional<int64_t> candidates_tokens;
    std::optional<int64_t> total_tokens;
};

/// Normalized generation result
struct GenerateResult
{
    std::string model;
    std::string text;
    std::optional<std::string> finish_reason;
    int64_t candidates_count = 0;
    UsageMetadata usage;
};

struct TokenCountResult
{
    std::string model;
    int64_t total_tokens = 0;
};

struct EmbeddingResult
{
    std::string model;
    std::vector<double> values;
};

// =============================================================================
// ModelGateway
// =============================================================================

/// Thin adapter over an IProviderClient
///
/// Builds the provider's request bodies and normalizes its responses; a
/// response carrying an error object or a blocked prompt becomes a
/// ProviderError.
class ModelGateway
{
  public:
    explicit ModelGateway(IProviderClient& client) : client_(client) {}

    GenerateResult generate(const GenerateRequest& request);
    TokenCountResult count_tokens(const std::string& model, const std::string& text);
    EmbeddingResult embed(const std::string& model, const std::string& text);

    /// Request body for `generateContent`
    static json build_generate_body(const GenerateRequest& request);

    /// Parse a `generateContent` response
    static GenerateResult parse_generate_response(const std::string& model, const json& response);

  private:
    IProviderClient& client_;
};

} // namespace geminimcp
