#include "ssemcp/exceptions.hpp"
#include "ssemcp/logging.hpp"
#include "ssemcp/mcp/protocol_handler.hpp"
#include "ssemcp/server/sse_server.hpp"
#include "ssemcp/settings.hpp"
#include "ssemcp/tools/builtin.hpp"
#include "ssemcp/tools/registry.hpp"
#include "ssemcp/version.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "ssemcp " << ssemcp::VERSION_MAJOR << "." << ssemcp::VERSION_MINOR << "."
              << ssemcp::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  ssemcp [port] [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>       JSON configuration file\n";
    std::cout << "  --host <host>         Listen address (default: localhost)\n";
    std::cout << "  --port <port>         Listen port (default: 8000)\n";
    std::cout << "  --log-level <level>   DEBUG, INFO, WARNING, ERROR\n";
    std::cout << "  --help                Show this help\n";
    std::cout << "\n";
    std::cout << "Environment: SSEMCP_NAME, SSEMCP_HOST, SSEMCP_PORT, SSEMCP_LOG_LEVEL,\n";
    std::cout << "             SSEMCP_LOG_FILE, SSEMCP_HEARTBEAT_INTERVAL, SSEMCP_CORS_ORIGIN\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<int> parse_port(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size() || v <= 0 || v > 65535)
            return std::nullopt;
        return v;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

static ssemcp::Settings load_settings(std::vector<std::string>& args)
{
    ssemcp::Settings settings;
    if (auto path = consume_flag_value(args, "--config"))
        settings = ssemcp::Settings::from_file(*path);
    settings.apply_env();

    if (auto host = consume_flag_value(args, "--host"))
        settings.host = *host;
    if (auto level = consume_flag_value(args, "--log-level"))
        settings.log_level = *level;
    if (auto port = consume_flag_value(args, "--port"))
    {
        auto parsed = parse_port(*port);
        if (!parsed)
            throw ssemcp::ConfigError("invalid port: " + *port);
        settings.port = *parsed;
    }

    // A bare positional argument is the port.
    if (!args.empty())
    {
        auto parsed = parse_port(args.front());
        if (!parsed)
            throw ssemcp::ConfigError("invalid port: " + args.front());
        settings.port = *parsed;
        args.erase(args.begin());
    }
    if (!args.empty())
        throw ssemcp::ConfigError("unexpected argument: " + args.front());
    return settings;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    ssemcp::Settings settings;
    try
    {
        settings = load_settings(args);
        ssemcp::logging::init(settings);
    }
    catch (const ssemcp::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return usage(1);
    }

    try
    {
        ssemcp::tools::ToolRegistry registry;
        auto count = ssemcp::tools::register_builtin_tools(registry, settings);

        ssemcp::mcp::ProtocolHandler handler(
            {settings.name, settings.version}, registry,
            {settings.strict_initialization, settings.validate_arguments});
        ssemcp::server::SseServer server(handler, settings);

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        if (!server.start())
        {
            spdlog::critical("failed to start server on {}:{}", settings.host, settings.port);
            return 1;
        }
        spdlog::info("SSE endpoint:  GET  http://{}:{}/sse", settings.host, server.port());
        spdlog::info("Message endpoint: POST http://{}:{}/sse", settings.host, server.port());
        spdlog::info("{} tools registered", count);

        while (!g_stop && server.running())
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        spdlog::info("shutting down");
        server.stop();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}
