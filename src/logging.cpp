#include "ssemcp/logging.hpp"

#include "ssemcp/exceptions.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace ssemcp::logging
{

spdlog::level::level_enum parse_level(const std::string& name)
{
    std::string lvl = name;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "TRACE")
        return spdlog::level::trace;
    if (lvl == "DEBUG")
        return spdlog::level::debug;
    if (lvl == "WARNING" || lvl == "WARN")
        return spdlog::level::warn;
    if (lvl == "ERROR")
        return spdlog::level::err;
    if (lvl == "CRITICAL")
        return spdlog::level::critical;
    if (lvl == "OFF")
        return spdlog::level::off;
    return spdlog::level::info;
}

void init(const Settings& settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!settings.log_file.empty())
    {
        try
        {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.log_file, false));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            throw ConfigError("cannot open log file " + settings.log_file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(settings.name, sinks.begin(), sinks.end());
    logger->set_level(parse_level(settings.log_level));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e - %n - %^%l%$ - %v");
    spdlog::set_default_logger(logger);
}

} // namespace ssemcp::logging
