// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file main.cpp
/// @brief gemini-mcp-server entry point: MCP over stdio, Gemini behind it

#include <geminimcp/geminimcp.hpp>

#include <iostream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <csignal>
#endif

int main(int argc, char* argv[])
{
    using namespace geminimcp;

    std::vector<std::string> args(argv + 1, argv + argc);

    ServerConfig config;
    try
    {
        config = load_config(args, process_environment());
    }
    catch (const ConfigError& e)
    {
        logger()->critical("{}", e.what());
        return 1;
    }

    // Nothing has been written to stdout yet, so these may use it
    if (config.show_help)
    {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (config.show_version)
    {
        std::cout << kServerName << " " << kServerVersion << "\n";
        return 0;
    }

    set_log_level(config.log_level);

#ifndef _WIN32
    // A vanished client surfaces as EPIPE on write instead
    std::signal(SIGPIPE, SIG_IGN);
#endif

    try
    {
        GeminiRestClient provider(config.api_key, config.api_base_url, config.http_timeout_ms);
        ModelGateway gateway(provider);
        InMemoryConversationStore conversations;
        ModelCatalog catalog = ModelCatalog::gemini_defaults();

        ToolContext context{gateway, conversations, catalog};
        context.default_model = config.default_model;

        ToolRegistry registry;
        register_builtin_tools(registry, context);

        Router router(registry, ServerInfo{kServerName, kServerVersion});

        Server server(
            std::make_unique<StdioTransport>(StdioTransport::standard_streams()), make_framer(config.framing), router
        );
        logger()->info("{} {} ready with {} tools", kServerName, kServerVersion, registry.size());
        server.run();
    }
    catch (const std::exception& e)
    {
        logger()->critical("Fatal: {}", e.what());
        return 1;
    }

    logger()->info("Shutting down");
    return 0;
}
