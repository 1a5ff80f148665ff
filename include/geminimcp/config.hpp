// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Startup configuration from environment and command line

#include <geminimcp/framing.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace geminimcp
{

/// Fatal startup configuration problem
class ConfigError : public std::runtime_error
{
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// Looks up one environment variable; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// EnvLookup over the process environment (empty values count as unset)
EnvLookup process_environment();

/// Resolved server configuration
struct ServerConfig
{
    // ─────────────────────────────────────────────────────────────────────────
    // Environment Variables
    // ─────────────────────────────────────────────────────────────────────────

    static constexpr const char* ENV_API_KEY = "GEMINI_API_KEY";
    static constexpr const char* ENV_FRAMING = "GEMINI_MCP_FRAMING";
    static constexpr const char* ENV_LOG_LEVEL = "GEMINI_MCP_LOG_LEVEL";
    static constexpr const char* ENV_DEFAULT_MODEL = "GEMINI_DEFAULT_MODEL";
    static constexpr const char* ENV_API_BASE_URL = "GEMINI_API_BASE_URL";
    static constexpr const char* ENV_HTTP_TIMEOUT_MS = "GEMINI_HTTP_TIMEOUT_MS";

    static constexpr const char* DEFAULT_API_BASE_URL = "https://generativelanguage.googleapis.com";

    std::string api_key;
    FramingMode framing = FramingMode::LineDelimited;
    std::string log_level = "info";
    std::string default_model = "gemini-2.5-flash";
    std::string api_base_url = DEFAULT_API_BASE_URL;
    long http_timeout_ms = 0;

    /// `--help` was given; nothing else is validated
    bool show_help = false;
    /// `--version` was given; nothing else is validated
    bool show_version = false;
};

/// Resolve configuration; flags override environment values
/// @param args Command-line arguments without the program name
/// @throws ConfigError on an unknown flag, an invalid value or a missing API key
ServerConfig load_config(const std::vector<std::string>& args, const EnvLookup& env);

/// Usage text for `--help`
std::string usage(const std::string& program);

} // namespace geminimcp
