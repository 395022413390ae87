#pragma once
#include "ssemcp/mcp/session.hpp"
#include "ssemcp/tools/dispatcher.hpp"
#include "ssemcp/tools/registry.hpp"
#include "ssemcp/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace ssemcp::mcp
{

struct ServerInfo
{
    std::string name{"ssemcp_server"};
    std::string version{"1.0.0"};
};

struct HandlerOptions
{
    /// Reject tools/list and tools/call with -32002 until the handshake completed.
    bool strict_initialization{false};
    /// Check tools/call arguments against the tool's inputSchema.
    bool validate_arguments{true};
};

/**
 * JSON-RPC front end of the MCP session state machine.
 *
 * handle() takes one decoded envelope plus the session it belongs to and
 * returns the JSON-RPC response, or std::nullopt when the message must not be
 * answered (notifications). It never throws for a request: every failure is
 * turned into an error response carrying the request id.
 *
 * Supported methods:
 * - initialize                  Uninitialized/any -> Initializing
 * - initialized (notification)  -> Ready, idempotent, also accepted as
 *                               notifications/initialized
 * - tools/list, tools/call, ping
 */
class ProtocolHandler
{
  public:
    using RequestFn = std::function<ssemcp::Json(Session&, const ssemcp::Json& params)>;
    using NotificationFn = std::function<void(Session&, const ssemcp::Json& params)>;

    ProtocolHandler(ServerInfo info, const tools::ToolRegistry& registry,
                    HandlerOptions options = {});

    // The dispatch tables capture `this`.
    ProtocolHandler(const ProtocolHandler&) = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    std::optional<ssemcp::Json> handle(const ssemcp::Json& message, Session& session) const;

    /// Capabilities advertised in the initialize result.
    static ssemcp::Json server_capabilities();

    const ServerInfo& info() const
    {
        return info_;
    }

  private:
    ssemcp::Json on_initialize(Session& session, const ssemcp::Json& params) const;
    ssemcp::Json on_tools_list(Session& session, const ssemcp::Json& params) const;
    ssemcp::Json on_tools_call(Session& session, const ssemcp::Json& params) const;
    void on_initialized(Session& session, const ssemcp::Json& params) const;

    void handle_notification(const std::string& method, const ssemcp::Json& params,
                             Session& session) const;

    ServerInfo info_;
    const tools::ToolRegistry& registry_;
    tools::ToolDispatcher dispatcher_;
    HandlerOptions options_;

    std::unordered_map<std::string, RequestFn> requests_;
    std::unordered_map<std::string, NotificationFn> notifications_;
};

} // namespace ssemcp::mcp
