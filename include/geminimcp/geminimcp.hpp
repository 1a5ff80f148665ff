// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file geminimcp.hpp
/// @brief Master include for the Gemini MCP server library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <geminimcp/config.hpp>
#include <geminimcp/conversation_store.hpp>
#include <geminimcp/framing.hpp>
#include <geminimcp/gateway.hpp>
#include <geminimcp/gemini_client.hpp>
#include <geminimcp/jsonrpc.hpp>
#include <geminimcp/log.hpp>
#include <geminimcp/model_catalog.hpp>
#include <geminimcp/router.hpp>
#include <geminimcp/schema.hpp>
#include <geminimcp/server.hpp>
#include <geminimcp/tool_registry.hpp>
#include <geminimcp/tools.hpp>
#include <geminimcp/transport.hpp>
#include <geminimcp/transport_stdio.hpp>
#include <geminimcp/types.hpp>

namespace geminimcp
{

/// Server version string
inline constexpr const char* kServerVersion = "1.0.0";

} // namespace geminimcp
