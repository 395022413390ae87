#include "ssemcp/mcp/protocol_handler.hpp"

#include "ssemcp/exceptions.hpp"
#include "ssemcp/mcp/jsonrpc.hpp"

#include <spdlog/spdlog.h>

namespace ssemcp::mcp
{

namespace
{
// Methods that stay available before the handshake even in strict mode.
bool allowed_before_initialize(const std::string& method)
{
    return method == "initialize" || method == "ping";
}

ssemcp::Json params_of(const ssemcp::Json& message)
{
    auto it = message.find("params");
    if (it == message.end() || it->is_null())
        return ssemcp::Json::object();
    if (!it->is_object())
        throw ssemcp::ValidationError("params must be an object");
    return *it;
}
} // namespace

ProtocolHandler::ProtocolHandler(ServerInfo info, const tools::ToolRegistry& registry,
                                 HandlerOptions options)
    : info_(std::move(info)), registry_(registry),
      dispatcher_(registry, options.validate_arguments), options_(options)
{
    requests_["initialize"] = [this](Session& s, const ssemcp::Json& p)
    { return on_initialize(s, p); };
    requests_["tools/list"] = [this](Session& s, const ssemcp::Json& p)
    { return on_tools_list(s, p); };
    requests_["tools/call"] = [this](Session& s, const ssemcp::Json& p)
    { return on_tools_call(s, p); };
    requests_["ping"] = [](Session&, const ssemcp::Json&) { return ssemcp::Json::object(); };

    auto initialized = [this](Session& s, const ssemcp::Json& p) { on_initialized(s, p); };
    notifications_["initialized"] = initialized;
    notifications_["notifications/initialized"] = initialized;
}

ssemcp::Json ProtocolHandler::server_capabilities()
{
    return ssemcp::Json{{"tools", ssemcp::Json::object()}, {"logging", ssemcp::Json::object()}};
}

ssemcp::Json ProtocolHandler::on_initialize(Session& session, const ssemcp::Json& params) const
{
    std::string requested;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string())
        requested = params["protocolVersion"].get<std::string>();

    ssemcp::Json capabilities = ssemcp::Json::object();
    if (params.contains("capabilities") && params["capabilities"].is_object())
        capabilities = params["capabilities"];

    ssemcp::Json client_info = params.value("clientInfo", ssemcp::Json());
    if (client_info.is_object())
    {
        auto field = [&](const char* key, const char* fallback)
        {
            auto it = client_info.find(key);
            return it != client_info.end() && it->is_string() ? it->get<std::string>()
                                                              : std::string(fallback);
        };
        spdlog::info("client {} {} requested protocol {}", field("name", "unknown"),
                     field("version", "?"), requested.empty() ? std::string("(none)") : requested);
    }

    session.begin_initialize(requested, capabilities, client_info);

    return ssemcp::Json{
        {"protocolVersion", ssemcp::PROTOCOL_VERSION},
        {"capabilities", server_capabilities()},
        {"serverInfo", ssemcp::Json{{"name", info_.name}, {"version", info_.version}}},
    };
}

void ProtocolHandler::on_initialized(Session& session, const ssemcp::Json&) const
{
    if (session.mark_initialized())
        spdlog::info("session {} ready", session.id().empty() ? "(default)" : session.id());
}

ssemcp::Json ProtocolHandler::on_tools_list(Session&, const ssemcp::Json&) const
{
    ssemcp::Json tools_array = ssemcp::Json::array();
    for (const auto& tool : registry_.list())
        tools_array.push_back(tool.descriptor());
    spdlog::debug("returning {} tools", tools_array.size());
    return ssemcp::Json{{"tools", tools_array}};
}

ssemcp::Json ProtocolHandler::on_tools_call(Session&, const ssemcp::Json& params) const
{
    if (!params.contains("name") || !params["name"].is_string())
        throw ssemcp::ValidationError("Missing tool name");
    auto name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", ssemcp::Json::object());
    return dispatcher_.dispatch(name, arguments);
}

void ProtocolHandler::handle_notification(const std::string& method, const ssemcp::Json& params,
                                          Session& session) const
{
    auto nit = notifications_.find(method);
    if (nit != notifications_.end())
    {
        nit->second(session, params);
        return;
    }
    // A request method sent without an id still runs; its result has nowhere to go.
    auto rit = requests_.find(method);
    if (rit != requests_.end())
    {
        rit->second(session, params);
        return;
    }
    spdlog::debug("ignoring unknown notification {}", method);
}

std::optional<ssemcp::Json> ProtocolHandler::handle(const ssemcp::Json& message,
                                                    Session& session) const
{
    if (!message.is_object())
        return jsonrpc::error(ssemcp::Json(), jsonrpc::INVALID_REQUEST,
                              "Invalid Request: expected a JSON object");

    const auto id = message.contains("id") ? message.at("id") : ssemcp::Json();
    const bool notification = jsonrpc::is_notification(message);

    std::string method;
    if (message.contains("method") && message["method"].is_string())
        method = message["method"].get<std::string>();

    // Notification-only methods never get a reply, even if the client attached an id.
    if (notification || notifications_.count(method))
    {
        try
        {
            handle_notification(method, params_of(message), session);
        }
        catch (const std::exception& e)
        {
            spdlog::error("notification {} failed: {}", method, e.what());
        }
        return std::nullopt;
    }

    spdlog::info("handling {}", method.empty() ? "(no method)" : method);

    auto it = requests_.find(method);
    if (it == requests_.end())
        return jsonrpc::error(id, jsonrpc::METHOD_NOT_FOUND, "Method not found: " + method);

    if (options_.strict_initialization && !allowed_before_initialize(method) &&
        session.state() != SessionState::Ready)
        return jsonrpc::error(id, jsonrpc::SERVER_NOT_INITIALIZED, "Server not initialized");

    try
    {
        return jsonrpc::result(id, it->second(session, params_of(message)));
    }
    catch (const std::exception& e)
    {
        spdlog::error("{} failed: {}", method, e.what());
        const char* prefix = method == "tools/call" ? "Error calling tool: " : "Internal error: ";
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, prefix + std::string(e.what()));
    }
}

} // namespace ssemcp::mcp
