#pragma once

/// @file ssemcp.hpp
/// @brief Main header for ssemcp - includes the components needed to serve tools
///
/// Usage:
/// @code
/// #include <ssemcp.hpp>
///
/// int main() {
///     ssemcp::tools::ToolRegistry registry;
///     ssemcp::tools::register_builtin_tools(registry);
///
///     ssemcp::mcp::ProtocolHandler handler({"myserver", "1.0.0"}, registry);
///     ssemcp::server::SseServer server(handler, ssemcp::Settings::from_env());
///     server.run();
/// }
/// @endcode

// Core types and exceptions
#include "ssemcp/types.hpp"
#include "ssemcp/exceptions.hpp"
#include "ssemcp/content.hpp"
#include "ssemcp/settings.hpp"
#include "ssemcp/logging.hpp"

// Tools
#include "ssemcp/tools/tool.hpp"
#include "ssemcp/tools/registry.hpp"
#include "ssemcp/tools/dispatcher.hpp"
#include "ssemcp/tools/builtin.hpp"

// Protocol
#include "ssemcp/mcp/jsonrpc.hpp"
#include "ssemcp/mcp/session.hpp"
#include "ssemcp/mcp/protocol_handler.hpp"

// Transport
#include "ssemcp/server/sse_server.hpp"
