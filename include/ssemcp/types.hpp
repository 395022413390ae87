#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace ssemcp
{

using Json = nlohmann::json;

/// MCP protocol revision this server negotiates during initialize.
inline constexpr const char* PROTOCOL_VERSION = "2024-11-05";

} // namespace ssemcp
