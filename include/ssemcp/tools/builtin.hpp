#pragma once
#include "ssemcp/settings.hpp"
#include "ssemcp/tools/registry.hpp"
#include "ssemcp/tools/tool.hpp"

namespace ssemcp::tools
{

/// echo {text} -> "echo: <text>"
Tool make_echo_tool();

/// get_star_info {star_name} -> catalogue entry for Sun, Sirius, Betelgeuse or Vega.
Tool make_star_info_tool();

/// classify_star {temperature, luminosity} -> spectral and luminosity class.
Tool make_classify_star_tool();

/// get_mood {name?} -> a randomly chosen mood line.
Tool make_mood_tool();

/// Register every built-in tool, skipping the ones disabled in settings.tools
/// and applying per-tool timeouts. Returns the number registered.
size_t register_builtin_tools(ToolRegistry& registry, const Settings& settings = {});

} // namespace ssemcp::tools
