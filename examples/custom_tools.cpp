#include <ssemcp/exceptions.hpp>
#include <ssemcp/logging.hpp>
#include <ssemcp/mcp/protocol_handler.hpp>
#include <ssemcp/server/sse_server.hpp>
#include <ssemcp/tools/builtin.hpp>
#include <ssemcp/tools/registry.hpp>

#include <chrono>
#include <iostream>
#include <thread>

// Example: SSE MCP server with extra tools
//
// Registers two arithmetic tools next to the built-in ones and serves them
// over SSE on port 8080.
//
// Usage:
//   ./ssemcp_example_custom_tools
//
// Then, from another terminal:
//   curl -N http://127.0.0.1:8080/sse
//   curl -X POST http://127.0.0.1:8080/sse -H 'Content-Type: application/json' \
//        -d '{"jsonrpc":"2.0","id":1,"method":"tools/call",
//             "params":{"name":"add","arguments":{"a":5,"b":7}}}'

int main()
{
    using Json = ssemcp::Json;

    ssemcp::Settings settings;
    settings.name = "calculator";
    settings.host = "127.0.0.1";
    settings.port = 8080;
    settings.log_level = "DEBUG";
    ssemcp::logging::init(settings);

    // ============================================================================
    // Step 1: Define tools
    // ============================================================================

    ssemcp::tools::ToolRegistry registry;
    ssemcp::tools::register_builtin_tools(registry, settings);

    Json binary_schema = {
        {"type", "object"},
        {"properties", Json{{"a", Json{{"type", "number"}}}, {"b", Json{{"type", "number"}}}}},
        {"required", Json::array({"a", "b"})}};

    registry.register_tool(ssemcp::tools::Tool(
        "add", "Add two numbers", binary_schema, [](const Json& input) -> Json
        { return input.at("a").get<double>() + input.at("b").get<double>(); }));

    ssemcp::tools::Tool divide(
        "divide", "Divide a by b", binary_schema,
        [](const Json& input) -> Json
        {
            double b = input.at("b").get<double>();
            if (b == 0)
                throw ssemcp::ValidationError("division by zero");
            return input.at("a").get<double>() / b;
        });
    divide.set_timeout(std::chrono::seconds(1));
    registry.register_tool(divide);

    // ============================================================================
    // Step 2: Serve
    // ============================================================================

    ssemcp::mcp::ProtocolHandler handler({settings.name, settings.version}, registry);
    ssemcp::server::SseServer server(handler, settings);

    std::cout << "Serving " << registry.size() << " tools on http://" << settings.host << ":"
              << settings.port << server.sse_path() << "\n";
    if (!server.run())
    {
        std::cerr << "Failed to start server\n";
        return 1;
    }
    return 0;
}
