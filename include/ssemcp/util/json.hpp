#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace ssemcp::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }

// Invalid UTF-8 coming back from a tool is replaced rather than thrown on the wire path.
inline std::string dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace ssemcp::util::json
