// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/config.hpp>
#include <geminimcp/log.hpp>
#include <geminimcp/model_catalog.hpp>

#include <cstdlib>
#include <sstream>

namespace geminimcp
{

namespace
{

FramingMode framing_value(const std::string& value, const std::string& source)
{
    auto mode = parse_framing_mode(value);
    if (!mode)
        throw ConfigError("Invalid framing '" + value + "' from " + source + " (expected line or length)");
    return *mode;
}

std::string log_level_value(const std::string& value, const std::string& source)
{
    if (parse_log_level(value) == spdlog::level::n_levels)
        throw ConfigError("Invalid log level '" + value + "' from " + source);
    return value;
}

long timeout_value(const std::string& value, const std::string& source)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        throw ConfigError("Invalid timeout '" + value + "' from " + source + " (expected milliseconds)");
    try
    {
        return std::stol(value);
    }
    catch (const std::out_of_range&)
    {
        throw ConfigError("Timeout out of range: " + value);
    }
}

/// Default model must be a generation model the tool schemas advertise
std::string model_value(const std::string& value, const std::string& source)
{
    if (value.empty())
        throw ConfigError("Empty value for " + source);
    auto generation = ModelCatalog::gemini_defaults().without(ModelCapability::Embedding);
    for (const auto& model : generation)
        if (model.name == value)
            return value;
    throw ConfigError("Unknown generation model '" + value + "' from " + source);
}

/// Split `--name=value`; nullopt when `arg` is not `--name=...`
std::optional<std::string> flag_value(const std::string& arg, const std::string& name)
{
    std::string prefix = name + "=";
    if (arg.compare(0, prefix.size(), prefix) == 0)
        return arg.substr(prefix.size());
    return std::nullopt;
}

} // namespace

EnvLookup process_environment()
{
    return [](const std::string& name) -> std::optional<std::string>
    {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr && value[0] != '\0')
            return std::string(value);
        return std::nullopt;
    };
}

ServerConfig load_config(const std::vector<std::string>& args, const EnvLookup& env)
{
    ServerConfig config;

    // Environment first
    if (auto v = env(ServerConfig::ENV_FRAMING))
        config.framing = framing_value(*v, ServerConfig::ENV_FRAMING);
    if (auto v = env(ServerConfig::ENV_LOG_LEVEL))
        config.log_level = log_level_value(*v, ServerConfig::ENV_LOG_LEVEL);
    if (auto v = env(ServerConfig::ENV_DEFAULT_MODEL))
        config.default_model = model_value(*v, ServerConfig::ENV_DEFAULT_MODEL);
    if (auto v = env(ServerConfig::ENV_API_BASE_URL))
        config.api_base_url = *v;
    if (auto v = env(ServerConfig::ENV_HTTP_TIMEOUT_MS))
        config.http_timeout_ms = timeout_value(*v, ServerConfig::ENV_HTTP_TIMEOUT_MS);

    // Then flags
    for (const auto& arg : args)
    {
        if (arg == "--help" || arg == "-h")
        {
            config.show_help = true;
            return config;
        }
        if (arg == "--version")
        {
            config.show_version = true;
            return config;
        }

        if (auto v = flag_value(arg, "--framing"))
            config.framing = framing_value(*v, "--framing");
        else if (auto v = flag_value(arg, "--log-level"))
            config.log_level = log_level_value(*v, "--log-level");
        else if (auto v = flag_value(arg, "--model"))
            config.default_model = model_value(*v, "--model");
        else if (auto v = flag_value(arg, "--timeout-ms"))
            config.http_timeout_ms = timeout_value(*v, "--timeout-ms");
        else
            throw ConfigError("Unknown argument: " + arg);
    }

    if (auto key = env(ServerConfig::ENV_API_KEY))
        config.api_key = *key;
    else
        throw ConfigError(std::string(ServerConfig::ENV_API_KEY) + " environment variable is required");

    return config;
}

std::string usage(const std::string& program)
{
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "MCP server exposing Google Gemini over stdio.\n"
        << "\n"
        << "Options:\n"
        << "  --framing=line|length   Message framing (env " << ServerConfig::ENV_FRAMING << ", default line)\n"
        << "  --log-level=LEVEL       trace, debug, info, warn, error, critical, off (env "
        << ServerConfig::ENV_LOG_LEVEL << ")\n"
        << "  --model=NAME            Default generation model (env " << ServerConfig::ENV_DEFAULT_MODEL << ")\n"
        << "  --timeout-ms=N          HTTP timeout, 0 for none (env " << ServerConfig::ENV_HTTP_TIMEOUT_MS << ")\n"
        << "  --version               Print the version and exit\n"
        << "  --help                  Print this help and exit\n"
        << "\n"
        << "Environment:\n"
        << "  " << ServerConfig::ENV_API_KEY << "          API key (required)\n"
        << "  " << ServerConfig::ENV_API_BASE_URL << "     API endpoint (default "
        << ServerConfig::DEFAULT_API_BASE_URL << ")\n";
    return out.str();
}

} // namespace geminimcp
