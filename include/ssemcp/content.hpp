#pragma once
#include "ssemcp/types.hpp"

#include <string>

namespace ssemcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

struct ImageContent
{
    std::string type{"image"};
    std::string data;     // base64-encoded image bytes
    std::string mimeType; // e.g., "image/png"
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

/// True if `j` looks like a single content block (an object with a string "type").
inline bool is_content_block(const Json& j)
{
    return j.is_object() && j.contains("type") && j["type"].is_string();
}

inline Json text_block(std::string text)
{
    return TextContent{"text", std::move(text)};
}

} // namespace ssemcp
