#include "ssemcp/settings.hpp"

#include "ssemcp/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ssemcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

// Longest accepted interval or timeout; larger values overflow steady_clock deadlines.
constexpr double MAX_DURATION_SECONDS = 24 * 60 * 60;

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::chrono::milliseconds seconds_to_ms(double seconds, const std::string& what)
{
    if (!std::isfinite(seconds) || seconds < 0)
        throw ConfigError(what + " must be a non-negative number of seconds");
    if (seconds > MAX_DURATION_SECONDS)
        throw ConfigError(what + " must be at most 86400 seconds");
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

static int parse_port(long long value)
{
    if (value <= 0 || value > 65535)
        throw ConfigError("port out of range: " + std::to_string(value));
    return static_cast<int>(value);
}

static int parse_port(const std::string& text)
{
    try
    {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size())
            throw ConfigError("invalid port: " + text);
        return parse_port(value);
    }
    catch (const std::logic_error&)
    {
        throw ConfigError("invalid port: " + text);
    }
}

// CORS lists may be written either as "a, b" or ["a", "b"].
static std::string join_list(const Json& j, const std::string& what)
{
    if (j.is_string())
        return j.get<std::string>();
    if (!j.is_array())
        throw ConfigError(what + " must be a string or an array of strings");
    std::string out;
    for (const auto& item : j)
    {
        if (!item.is_string())
            throw ConfigError(what + " must be a string or an array of strings");
        if (!out.empty())
            out += ", ";
        out += item.get<std::string>();
    }
    return out;
}

static std::chrono::milliseconds heartbeat_ms(double seconds, const std::string& what)
{
    auto ms = seconds_to_ms(seconds, what);
    if (ms.count() <= 0)
        throw ConfigError(what + " must be positive");
    return ms;
}

template <typename T>
static T get_as(const Json& section, const char* key, const std::string& where)
{
    try
    {
        return section.at(key).get<T>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

bool Settings::tool_enabled(const std::string& tool_name) const
{
    auto it = tools.find(tool_name);
    return it == tools.end() || it->second.enabled;
}

std::chrono::milliseconds Settings::tool_timeout(const std::string& tool_name) const
{
    auto it = tools.find(tool_name);
    return it == tools.end() ? std::chrono::milliseconds(0) : it->second.timeout;
}

void Settings::apply_env()
{
    name = getenv_str("SSEMCP_NAME", name);
    version = getenv_str("SSEMCP_VERSION", version);
    host = getenv_str("SSEMCP_HOST", host);
    if (const char* v = std::getenv("SSEMCP_PORT"))
        port = parse_port(std::string(v));

    log_level = upper(getenv_str("SSEMCP_LOG_LEVEL", log_level));
    log_file = getenv_str("SSEMCP_LOG_FILE", log_file);

    if (const char* v = std::getenv("SSEMCP_HEARTBEAT_INTERVAL"))
    {
        try
        {
            heartbeat_interval = heartbeat_ms(std::stod(v), "SSEMCP_HEARTBEAT_INTERVAL");
        }
        catch (const std::logic_error&)
        {
            throw ConfigError(std::string("invalid SSEMCP_HEARTBEAT_INTERVAL: ") + v);
        }
    }
    cors_origin = getenv_str("SSEMCP_CORS_ORIGIN", cors_origin);
}

Settings Settings::from_env()
{
    Settings s;
    s.apply_env();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (!j.is_object())
        throw ConfigError("configuration root must be an object");

    if (j.contains("server"))
    {
        const auto& server = j.at("server");
        if (server.contains("name"))
            s.name = get_as<std::string>(server, "name", "server");
        if (server.contains("version"))
            s.version = get_as<std::string>(server, "version", "server");
        if (server.contains("host"))
            s.host = get_as<std::string>(server, "host", "server");
        if (server.contains("port"))
            s.port = parse_port(get_as<long long>(server, "port", "server"));
    }

    if (j.contains("logging"))
    {
        const auto& logging = j.at("logging");
        if (logging.contains("level"))
            s.log_level = upper(get_as<std::string>(logging, "level", "logging"));
        if (logging.contains("file") && !logging.at("file").is_null())
            s.log_file = get_as<std::string>(logging, "file", "logging");
    }

    if (j.contains("sse"))
    {
        const auto& sse = j.at("sse");
        if (sse.contains("heartbeat_interval"))
            s.heartbeat_interval = heartbeat_ms(
                get_as<double>(sse, "heartbeat_interval", "sse"), "sse.heartbeat_interval");
        if (sse.contains("max_connections"))
        {
            auto n = get_as<long long>(sse, "max_connections", "sse");
            if (n <= 0)
                throw ConfigError("sse.max_connections must be positive");
            s.max_connections = static_cast<size_t>(n);
        }
    }

    if (j.contains("cors"))
    {
        const auto& cors = j.at("cors");
        if (cors.contains("allow_origins"))
            s.cors_origin = join_list(cors.at("allow_origins"), "cors.allow_origins");
        if (cors.contains("allow_methods"))
            s.cors_methods = join_list(cors.at("allow_methods"), "cors.allow_methods");
        if (cors.contains("allow_headers"))
            s.cors_headers = join_list(cors.at("allow_headers"), "cors.allow_headers");
    }

    if (j.contains("protocol"))
    {
        const auto& protocol = j.at("protocol");
        if (protocol.contains("strict_initialization"))
            s.strict_initialization =
                get_as<bool>(protocol, "strict_initialization", "protocol");
        if (protocol.contains("validate_arguments"))
            s.validate_arguments = get_as<bool>(protocol, "validate_arguments", "protocol");
    }

    if (j.contains("tools"))
    {
        const auto& tools = j.at("tools");
        if (!tools.is_array())
            throw ConfigError("tools must be an array");
        for (const auto& entry : tools)
        {
            if (!entry.is_object() || !entry.contains("name"))
                throw ConfigError("each tools entry needs a name");
            auto tool_name = get_as<std::string>(entry, "name", "tools[]");
            ToolSettings ts;
            if (entry.contains("enabled"))
                ts.enabled = get_as<bool>(entry, "enabled", "tools[" + tool_name + "]");
            if (entry.contains("timeout"))
                ts.timeout = seconds_to_ms(
                    get_as<double>(entry, "timeout", "tools[" + tool_name + "]"),
                    "tools[" + tool_name + "].timeout");
            s.tools[tool_name] = ts;
        }
    }
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open config file: " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    try
    {
        return from_json(Json::parse(buf.str()));
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
}

} // namespace ssemcp
