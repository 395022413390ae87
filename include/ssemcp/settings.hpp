#pragma once
#include "ssemcp/types.hpp"

#include <chrono>
#include <string>
#include <unordered_map>

namespace ssemcp
{

struct ToolSettings
{
    bool enabled{true};
    std::chrono::milliseconds timeout{0}; ///< zero = no limit
};

struct Settings
{
    // server
    std::string name{"ssemcp_server"};
    std::string version{"1.0.0"};
    std::string host{"localhost"};
    int port{8000};

    // logging
    std::string log_level{"INFO"};
    std::string log_file; ///< empty = console only

    // sse
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
    size_t max_connections{100};

    // cors (empty origin = no CORS headers)
    std::string cors_origin{"*"};
    std::string cors_methods{"GET, POST, OPTIONS"};
    std::string cors_headers{"*"};

    // protocol
    bool strict_initialization{false};
    bool validate_arguments{true};

    std::unordered_map<std::string, ToolSettings> tools;

    bool tool_enabled(const std::string& tool_name) const;
    std::chrono::milliseconds tool_timeout(const std::string& tool_name) const;

    /// Overlay SSEMCP_* environment variables onto this instance.
    void apply_env();

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);
};

} // namespace ssemcp
