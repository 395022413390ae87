/// @file protocol_handler.cpp
/// @brief Lifecycle and dispatch tests for the MCP protocol handler

#include "ssemcp/mcp/jsonrpc.hpp"
#include "ssemcp/mcp/protocol_handler.hpp"
#include "ssemcp/tools/builtin.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace ssemcp;
using namespace ssemcp::mcp;

static Json initialize_request(int id)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"method", "initialize"},
                {"params",
                 Json{{"protocolVersion", "2024-11-05"},
                      {"capabilities", Json{{"sampling", Json::object()}}},
                      {"clientInfo", Json{{"name", "test"}, {"version", "1.0.0"}}}}}};
}

static Json request(int id, const std::string& method, Json params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

void test_initialize(const ProtocolHandler& handler)
{
    std::cout << "  test_initialize... " << std::flush;
    Session session;
    auto resp = handler.handle(initialize_request(1), session);
    assert(resp.has_value());
    assert((*resp)["jsonrpc"] == "2.0");
    assert((*resp)["id"] == 1);
    assert(!resp->contains("error"));

    const auto& result = (*resp)["result"];
    assert(result["protocolVersion"] == "2024-11-05");
    assert(result["serverInfo"]["name"] == "stars");
    assert(result["serverInfo"]["version"] == "9.9.9");
    // Only what the server supports, never the client's sampling capability
    assert(result["capabilities"] == (Json{{"tools", Json::object()}, {"logging", Json::object()}}));

    assert(session.state() == SessionState::Initializing);
    assert(session.client_capabilities().contains("sampling"));
    assert(session.protocol_version() == "2024-11-05");
    std::cout << "PASSED\n";
}

void test_initialize_without_params(const ProtocolHandler& handler)
{
    std::cout << "  test_initialize_without_params... " << std::flush;
    Session session;
    auto resp = handler.handle(Json{{"jsonrpc", "2.0"}, {"id", "init-a"}, {"method", "initialize"}},
                               session);
    assert(resp && (*resp)["id"] == "init-a");
    assert((*resp)["result"]["protocolVersion"] == "2024-11-05");
    assert(session.client_capabilities() == Json::object());
    assert(session.state() == SessionState::Initializing);
    std::cout << "PASSED\n";
}

void test_initialize_odd_client_info(const ProtocolHandler& handler)
{
    std::cout << "  test_initialize_odd_client_info... " << std::flush;
    Session session;
    Json req = {{"jsonrpc", "2.0"},
                {"id", 11},
                {"method", "initialize"},
                {"params", {{"protocolVersion", 42},
                            {"capabilities", "none"},
                            {"clientInfo", {{"name", 5}, {"version", nullptr}}}}}};
    auto resp = handler.handle(req, session);
    assert(resp && resp->contains("result"));
    assert(!resp->contains("error"));
    assert((*resp)["result"]["protocolVersion"] == "2024-11-05");
    assert(session.state() == SessionState::Initializing);
    assert(session.protocol_version().empty());
    assert(session.client_capabilities() == Json::object());
    assert(session.client_info()["name"] == 5);
    std::cout << "PASSED\n";
}

void test_initialized_notification(const ProtocolHandler& handler)
{
    std::cout << "  test_initialized_notification... " << std::flush;
    Session session;
    handler.handle(initialize_request(1), session);

    Json note = {{"jsonrpc", "2.0"}, {"method", "initialized"}};
    assert(!handler.handle(note, session).has_value());
    assert(session.state() == SessionState::Ready);

    // Idempotent
    assert(!handler.handle(note, session).has_value());
    assert(session.state() == SessionState::Ready);

    // MCP clients send the namespaced form; an id never earns a reply either
    Session other;
    handler.handle(initialize_request(2), other);
    Json namespaced = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "notifications/initialized"}};
    assert(!handler.handle(namespaced, other).has_value());
    assert(other.state() == SessionState::Ready);
    std::cout << "PASSED\n";
}

void test_tools_list_any_state(const ProtocolHandler& handler)
{
    std::cout << "  test_tools_list_any_state... " << std::flush;
    Session fresh;
    auto resp = handler.handle(request(3, "tools/list"), fresh);
    assert(resp && (*resp)["id"] == 3);
    const auto& tools = (*resp)["result"]["tools"];
    assert(tools.size() == 4);
    assert(tools[0]["name"] == "echo");
    assert(tools[1]["name"] == "get_star_info");
    assert(tools[2]["name"] == "classify_star");
    assert(tools[3]["name"] == "get_mood");
    for (const auto& t : tools)
    {
        assert(t.contains("description"));
        assert(t["inputSchema"]["type"] == "object");
    }
    assert(fresh.state() == SessionState::Uninitialized);
    std::cout << "PASSED\n";
}

void test_tools_call(const ProtocolHandler& handler)
{
    std::cout << "  test_tools_call... " << std::flush;
    Session session;
    auto resp = handler.handle(
        request(2, "tools/call", Json{{"name", "echo"}, {"arguments", Json{{"text", "hi"}}}}),
        session);
    assert(resp && (*resp)["id"] == 2);
    assert((*resp)["result"]["content"][0]["type"] == "text");
    assert((*resp)["result"]["content"][0]["text"] == "echo: hi");
    std::cout << "PASSED\n";
}

void test_tools_call_errors(const ProtocolHandler& handler)
{
    std::cout << "  test_tools_call_errors... " << std::flush;
    Session session;

    auto unknown = handler.handle(request(4, "tools/call", Json{{"name", "nope"}}), session);
    assert(unknown && (*unknown)["id"] == 4);
    assert((*unknown)["error"]["code"] == jsonrpc::INTERNAL_ERROR);
    assert((*unknown)["error"]["message"].get<std::string>().find("nope") != std::string::npos);
    assert(!unknown->contains("result"));

    auto missing_name = handler.handle(request(5, "tools/call"), session);
    assert((*missing_name)["error"]["code"] == jsonrpc::INTERNAL_ERROR);

    auto bad_args = handler.handle(
        request(6, "tools/call", Json{{"name", "echo"}, {"arguments", Json{{"text", 1}}}}),
        session);
    assert((*bad_args)["error"]["code"] == jsonrpc::INTERNAL_ERROR);
    assert(!bad_args->contains("result"));

    Json bad_params = {{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/call"}, {"params", "x"}};
    auto resp = handler.handle(bad_params, session);
    assert((*resp)["id"] == 8);
    assert((*resp)["error"]["code"] == jsonrpc::INTERNAL_ERROR);
    std::cout << "PASSED\n";
}

void test_unknown_method(const ProtocolHandler& handler)
{
    std::cout << "  test_unknown_method... " << std::flush;
    Session session;
    auto resp = handler.handle(request(9, "resources/list"), session);
    assert(resp && (*resp)["id"] == 9);
    assert((*resp)["error"]["code"] == jsonrpc::METHOD_NOT_FOUND);
    assert((*resp)["error"]["message"] == "Method not found: resources/list");

    // Unknown notifications are dropped silently
    assert(!handler.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}}, session)
                .has_value());
    std::cout << "PASSED\n";
}

void test_ping_and_invalid(const ProtocolHandler& handler)
{
    std::cout << "  test_ping_and_invalid... " << std::flush;
    Session session;
    auto pong = handler.handle(request(10, "ping"), session);
    assert((*pong)["result"] == Json::object());

    auto invalid = handler.handle(Json::array({1, 2}), session);
    assert(invalid && (*invalid)["error"]["code"] == jsonrpc::INVALID_REQUEST);
    assert((*invalid)["id"].is_null());
    std::cout << "PASSED\n";
}

void test_full_lifecycle(const ProtocolHandler& handler)
{
    std::cout << "  test_full_lifecycle... " << std::flush;
    Session session;
    assert(session.state() == SessionState::Uninitialized);
    handler.handle(initialize_request(1), session);
    assert(session.state() == SessionState::Initializing);
    handler.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, session);
    assert(session.state() == SessionState::Ready);
    auto resp = handler.handle(request(2, "tools/call",
                                       Json{{"name", "classify_star"},
                                            {"arguments", Json{{"temperature", 5778},
                                                               {"luminosity", 1}}}}),
                               session);
    assert((*resp)["result"]["content"][0]["text"].get<std::string>().find("G-type") !=
           std::string::npos);
    std::cout << "PASSED\n";
}

void test_strict_initialization(const tools::ToolRegistry& registry)
{
    std::cout << "  test_strict_initialization... " << std::flush;
    HandlerOptions options;
    options.strict_initialization = true;
    ProtocolHandler strict({"strict", "1.0.0"}, registry, options);

    Session session;
    auto early = strict.handle(request(1, "tools/list"), session);
    assert((*early)["error"]["code"] == jsonrpc::SERVER_NOT_INITIALIZED);
    assert((*early)["id"] == 1);

    assert(strict.handle(request(2, "ping"), session)->contains("result"));
    strict.handle(initialize_request(3), session);
    auto between = strict.handle(request(4, "tools/list"), session);
    assert((*between)["error"]["code"] == jsonrpc::SERVER_NOT_INITIALIZED);

    strict.handle(Json{{"jsonrpc", "2.0"}, {"method", "initialized"}}, session);
    auto ready = strict.handle(request(5, "tools/list"), session);
    assert(ready->contains("result"));
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "ProtocolHandler tests\n";
    tools::ToolRegistry registry;
    tools::register_builtin_tools(registry);
    ProtocolHandler handler({"stars", "9.9.9"}, registry);

    test_initialize(handler);
    test_initialize_without_params(handler);
    test_initialize_odd_client_info(handler);
    test_initialized_notification(handler);
    test_tools_list_any_state(handler);
    test_tools_call(handler);
    test_tools_call_errors(handler);
    test_unknown_method(handler);
    test_ping_and_invalid(handler);
    test_full_lifecycle(handler);
    test_strict_initialization(registry);
    std::cout << "All tests passed\n";
    return 0;
}
