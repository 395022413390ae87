#include "ssemcp/tools/dispatcher.hpp"

#include "ssemcp/content.hpp"
#include "ssemcp/exceptions.hpp"
#include "ssemcp/util/json_schema.hpp"

#include <spdlog/spdlog.h>

namespace ssemcp::tools
{

ssemcp::Json ToolDispatcher::normalize_content(const ssemcp::Json& result)
{
    if (result.is_array())
    {
        ssemcp::Json content = ssemcp::Json::array();
        for (const auto& item : result)
        {
            if (is_content_block(item))
                content.push_back(item);
            else if (item.is_string())
                content.push_back(text_block(item.get<std::string>()));
            else
                content.push_back(text_block(item.dump()));
        }
        return content;
    }
    if (is_content_block(result))
        return ssemcp::Json::array({result});
    if (result.is_string())
        return ssemcp::Json::array({text_block(result.get<std::string>())});
    if (result.is_null())
        return ssemcp::Json::array();
    return ssemcp::Json::array({text_block(result.dump())});
}

ssemcp::Json ToolDispatcher::dispatch(const std::string& name, const ssemcp::Json& arguments) const
{
    const Tool* tool = registry_.resolve(name);
    if (!tool)
        throw ssemcp::NotFoundError("Unknown tool: " + name);

    ssemcp::Json args = arguments.is_null() ? ssemcp::Json::object() : arguments;
    if (!args.is_object())
        throw ssemcp::ValidationError("arguments for tool '" + name + "' must be an object");

    if (validate_arguments_)
        util::schema::validate(tool->input_schema(), args);

    spdlog::debug("invoking tool {} with {}", name, args.dump());
    auto result = tool->invoke(args);

    return ssemcp::Json{{"content", normalize_content(result)}};
}

} // namespace ssemcp::tools
