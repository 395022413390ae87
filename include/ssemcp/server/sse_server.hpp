#pragma once
#include "ssemcp/mcp/protocol_handler.hpp"
#include "ssemcp/mcp/session.hpp"
#include "ssemcp/settings.hpp"
#include "ssemcp/types.hpp"

#include <atomic>
#include <condition_variable>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ssemcp::server
{

/**
 * SSE (Server-Sent Events) MCP server.
 *
 * Endpoints (paths relative to `sse_path`, default "/sse"):
 * - GET  /sse     Opens the event stream. Emits `connected` once with
 *                 {"type":"connected","sessionId":...}, then `ping` every
 *                 heartbeat_interval. The stream owns a Session that is
 *                 destroyed when the stream ends.
 * - POST /sse     One JSON-RPC envelope per call. The JSON-RPC response is the
 *                 HTTP response body (200), or 204 for notifications. Responses
 *                 are never written to the event stream. Invalid JSON -> 400
 *                 with a -32700 error.
 * - GET  /health  {"status":"healthy","server":name,"version":version}
 *
 * A POST picks its session from the `session_id` query parameter or the
 * `Mcp-Session-Id` header; without either it uses a process-wide default
 * session.
 *
 * Usage:
 *   ssemcp::tools::ToolRegistry registry;
 *   ssemcp::tools::register_builtin_tools(registry);
 *   ssemcp::mcp::ProtocolHandler handler({"myserver", "1.0.0"}, registry);
 *   SseServer server(handler, settings);
 *   server.start(); // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();  // Graceful shutdown
 */
class SseServer
{
  public:
    SseServer(const mcp::ProtocolHandler& handler, ssemcp::Settings settings,
              std::string sse_path = "/sse", std::string health_path = "/health");

    ~SseServer();

    SseServer(const SseServer&) = delete;
    SseServer& operator=(const SseServer&) = delete;

    /**
     * Bind and start serving on a background thread (non-blocking).
     *
     * @return false if already running or the address could not be bound
     */
    bool start();

    /**
     * Bind and serve on the calling thread until stop() is called.
     *
     * @return false if the address could not be bound
     */
    bool run();

    /**
     * Stop the server: ends every event stream and joins the listener thread.
     * Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Bound port (the actual one when constructed with port 0).
    int port() const
    {
        return port_;
    }

    const std::string& host() const
    {
        return settings_.host;
    }

    const std::string& sse_path() const
    {
        return sse_path_;
    }

    /// Number of open event streams.
    size_t connection_count() const;

    /// Session owned by an open stream, or nullptr.
    std::shared_ptr<mcp::Session> find_session(const std::string& session_id) const;

    /// Session used by POSTs that name no stream.
    std::shared_ptr<mcp::Session> default_session() const
    {
        return default_session_;
    }

    /// "event: <name>\ndata: <json>\n\n"
    static std::string format_event(const std::string& name, const ssemcp::Json& data);

  private:
    struct Connection
    {
        std::shared_ptr<mcp::Session> session;
        std::mutex m;
        std::condition_variable cv;
        bool alive{true};
    };

    bool bind();
    void setup_routes();
    void stream_events(httplib::DataSink& sink, const std::shared_ptr<Connection>& conn);
    void release_connection(const std::string& session_id);
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void apply_cors(httplib::Response& res) const;
    std::string generate_session_id();

    const mcp::ProtocolHandler& handler_;
    ssemcp::Settings settings_;
    std::string sse_path_;
    std::string health_path_;
    int port_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::shared_ptr<mcp::Session> default_session_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
    mutable std::mutex conns_mutex_;
};

} // namespace ssemcp::server
