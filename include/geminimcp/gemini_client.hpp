// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/gateway.hpp>

#include <string>

namespace geminimcp
{

/// Google Generative Language REST client built on libcurl
///
/// Each call is a blocking `POST {base_url}/v1beta/models/{model}:{operation}`
/// on a fresh easy handle, so calls from different threads do not share
/// state. No retries.
class GeminiRestClient : public IProviderClient
{
  public:
    /// @param timeout_ms Whole-request timeout; 0 waits indefinitely
    GeminiRestClient(std::string api_key, std::string base_url, long timeout_ms = 0);
    ~GeminiRestClient() override;

    GeminiRestClient(const GeminiRestClient&) = delete;
    GeminiRestClient& operator=(const GeminiRestClient&) = delete;

    json generate_content(const std::string& model, const json& body) override;
    json count_tokens(const std::string& model, const json& body) override;
    json embed_content(const std::string& model, const json& body) override;

    /// Endpoint URL for one model operation
    std::string endpoint(const std::string& model, const std::string& operation) const;

  private:
    json post(const std::string& model, const std::string& operation, const json& body);

    std::string api_key_;
    std::string base_url_;
    long timeout_ms_;
};

} // namespace geminimcp
