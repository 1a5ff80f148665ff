// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/gemini_client.hpp>
#include <geminimcp/log.hpp>

#include <curl/curl.h>

#include <memory>
#include <sstream>

namespace geminimcp
{

namespace
{

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

struct EasyHandleDeleter
{
    void operator()(CURL* handle) const
    {
        curl_easy_cleanup(handle);
    }
};

struct HeaderListDeleter
{
    void operator()(curl_slist* list) const
    {
        curl_slist_free_all(list);
    }
};

/// Pull `error.message` out of an error body, falling back to the raw text
std::string describe_error_body(const std::string& body)
{
    try
    {
        auto parsed = json::parse(body);
        if (parsed.contains("error") && parsed["error"].is_object() &&
            parsed["error"].contains("message") && parsed["error"]["message"].is_string())
            return parsed["error"]["message"].get<std::string>();
    }
    catch (const json::parse_error&)
    {
        // not JSON; fall through to the raw body
    }
    constexpr size_t kMaxExcerpt = 512;
    return body.size() > kMaxExcerpt ? body.substr(0, kMaxExcerpt) + "..." : body;
}

} // namespace

GeminiRestClient::GeminiRestClient(std::string api_key, std::string base_url, long timeout_ms)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/')
        base_url_.pop_back();

    // Must run before any worker thread touches libcurl
    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK)
        throw ProviderError(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
}

GeminiRestClient::~GeminiRestClient()
{
    curl_global_cleanup();
}

std::string GeminiRestClient::endpoint(const std::string& model, const std::string& operation) const
{
    return base_url_ + "/v1beta/models/" + model + ":" + operation;
}

json GeminiRestClient::generate_content(const std::string& model, const json& body)
{
    return post(model, "generateContent", body);
}

json GeminiRestClient::count_tokens(const std::string& model, const json& body)
{
    return post(model, "countTokens", body);
}

json GeminiRestClient::embed_content(const std::string& model, const json& body)
{
    return post(model, "embedContent", body);
}

json GeminiRestClient::post(const std::string& model, const std::string& operation, const json& body)
{
    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (!handle)
        throw ProviderError("curl_easy_init failed");

    const std::string url = endpoint(model, operation);
    const std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string response;

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms_ > 0)
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, ("x-goog-api-key: " + api_key_).c_str());
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());

    logger()->debug("POST {}", url);
    const CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK)
    {
        std::ostringstream oss;
        oss << "[gemini] " << operation << " request failed: " << curl_easy_strerror(code);
        throw ProviderError(oss.str());
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
    {
        std::ostringstream oss;
        oss << "[gemini] " << operation << " failed with HTTP " << status << ": "
            << describe_error_body(response);
        throw ProviderError(oss.str(), status);
    }

    try
    {
        return json::parse(response);
    }
    catch (const json::parse_error& e)
    {
        throw ProviderError(std::string("[gemini] invalid JSON in response: ") + e.what(), status);
    }
}

} // namespace geminimcp
