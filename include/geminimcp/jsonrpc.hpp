// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/types.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace geminimcp
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

/// JSON-RPC error codes
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

/// Exception for failures that should reach the caller with a specific code
///
/// Anything thrown beneath the router that is not a JsonRpcError is reported
/// as InternalError with the exception's message.
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(JsonRpcErrorCode code, const std::string& message, const json& data = nullptr)
        : std::runtime_error(message), code_(code), data_(data)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }
    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC request ID (string, integer or non-integral number)
///
/// uint64_t only holds integers above INT64_MAX so they echo back unchanged.
using JsonRpcId = std::variant<std::string, int64_t, uint64_t, double>;

/// Convert JsonRpcId to JSON
inline json id_to_json(const JsonRpcId& id)
{
    return std::visit([](const auto& v) -> json { return v; }, id);
}

/// Parse JsonRpcId from JSON
inline JsonRpcId id_from_json(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    else if (j.is_number_unsigned() &&
             j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        return j.get<uint64_t>();
    else if (j.is_number_integer())
        return j.get<int64_t>();
    else if (j.is_number_float())
        return j.get<double>();
    throw std::runtime_error("Invalid JSON-RPC id type");
}

/// JSON-RPC 2.0 Request
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id; // nullopt for notifications

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        if (id)
            j["id"] = id_to_json(*id);
        return j;
    }

    /// @throws JsonRpcError(InvalidRequest) when the value is not a request object
    static JsonRpcRequest from_json(const json& j)
    {
        if (!j.is_object())
            throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Request must be a JSON object");

        JsonRpcRequest req;
        if (j.contains("id") && !j.at("id").is_null())
        {
            try
            {
                req.id = id_from_json(j.at("id"));
            }
            catch (const std::runtime_error& e)
            {
                throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, e.what());
            }
        }

        if (!j.contains("method") || !j.at("method").is_string())
            throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "Request is missing a string method");
        req.method = j.at("method").get<std::string>();
        if (j.contains("params"))
            req.params = j.at("params");
        return req;
    }

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code = static_cast<int>(JsonRpcErrorCode::InternalError);
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    static JsonRpcErrorObject from_json(const json& j)
    {
        JsonRpcErrorObject err;
        err.code = j.at("code").get<int>();
        err.message = j.at("message").get<std::string>();
        if (j.contains("data"))
            err.data = j.at("data");
        return err;
    }
};

/// JSON-RPC 2.0 Response
///
/// Holds exactly one of a result or an error; the variant makes "both" and
/// "neither" unrepresentable.
struct JsonRpcResponse
{
    JsonRpcId id;
    std::variant<json, JsonRpcErrorObject> outcome;

    static JsonRpcResponse success(JsonRpcId id, json result)
    {
        return JsonRpcResponse{std::move(id), std::move(result)};
    }

    static JsonRpcResponse failure(JsonRpcId id, JsonRpcErrorObject error)
    {
        return JsonRpcResponse{std::move(id), std::move(error)};
    }

    static JsonRpcResponse failure(
        JsonRpcId id, JsonRpcErrorCode code, const std::string& message, const json& data = nullptr
    )
    {
        return failure(std::move(id), JsonRpcErrorObject{static_cast<int>(code), message, data});
    }

    bool is_error() const
    {
        return std::holds_alternative<JsonRpcErrorObject>(outcome);
    }

    /// @throws std::bad_variant_access on an error response
    const json& result() const
    {
        return std::get<json>(outcome);
    }

    /// @throws std::bad_variant_access on a success response
    const JsonRpcErrorObject& error() const
    {
        return std::get<JsonRpcErrorObject>(outcome);
    }

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}};
        if (is_error())
            j["error"] = error().to_json();
        else
            j["result"] = result();
        return j;
    }

    /// @throws std::runtime_error unless exactly one of result/error is present
    static JsonRpcResponse from_json(const json& j)
    {
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (has_result == has_error)
            throw std::runtime_error("Response must carry exactly one of result or error");

        JsonRpcId id = id_from_json(j.at("id"));
        if (has_error)
            return failure(std::move(id), JsonRpcErrorObject::from_json(j.at("error")));
        return success(std::move(id), j.at("result"));
    }
};

} // namespace geminimcp
