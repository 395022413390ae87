#pragma once
#include "ssemcp/types.hpp"

#include <string>

namespace ssemcp::mcp::jsonrpc
{

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;
constexpr int SERVER_NOT_INITIALIZED = -32002;

inline ssemcp::Json result(const ssemcp::Json& id, ssemcp::Json result)
{
    return ssemcp::Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

inline ssemcp::Json error(const ssemcp::Json& id, int code, const std::string& message)
{
    return ssemcp::Json{{"jsonrpc", "2.0"},
                        {"id", id.is_null() ? ssemcp::Json() : id},
                        {"error", ssemcp::Json{{"code", code}, {"message", message}}}};
}

/// A message without an id (or with a null id) expects no response.
inline bool is_notification(const ssemcp::Json& message)
{
    return !message.contains("id") || message["id"].is_null();
}

} // namespace ssemcp::mcp::jsonrpc
