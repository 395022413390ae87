#pragma once
#include "ssemcp/settings.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace ssemcp::logging
{

/// Map a configured level name (DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL, OFF;
/// case-insensitive) to spdlog's level. Unknown names fall back to info.
spdlog::level::level_enum parse_level(const std::string& name);

/// Install the process-wide default logger: colored stderr, plus a file sink
/// when settings.log_file is set. Safe to call again to reconfigure.
void init(const Settings& settings);

} // namespace ssemcp::logging
