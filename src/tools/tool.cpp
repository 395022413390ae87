#include "ssemcp/tools/tool.hpp"

#include "ssemcp/exceptions.hpp"

#include <future>
#include <memory>
#include <thread>

namespace ssemcp::tools
{

ssemcp::Json Tool::invoke(const ssemcp::Json& input, bool enforce_timeout) const
{
    if (!fn_)
        throw ssemcp::Error("tool '" + name_ + "' has no implementation");

    if (!enforce_timeout || timeout_.count() <= 0)
        return fn_(input);

    // The worker owns copies of everything it touches so it can outlive this call.
    auto promise = std::make_shared<std::promise<ssemcp::Json>>();
    auto future = promise->get_future();
    std::thread(
        [promise, fn = fn_, input]()
        {
            try
            {
                promise->set_value(fn(input));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        })
        .detach();

    if (future.wait_for(timeout_) != std::future_status::ready)
        throw ssemcp::ToolTimeoutError("tool '" + name_ + "' timed out after " +
                                       std::to_string(timeout_.count()) + "ms");
    return future.get();
}

ssemcp::Json Tool::descriptor() const
{
    ssemcp::Json schema = input_schema_;
    if (schema.is_null() || schema.empty())
        schema = ssemcp::Json{{"type", "object"}, {"properties", ssemcp::Json::object()}};
    return ssemcp::Json{{"name", name_}, {"description", description_}, {"inputSchema", schema}};
}

} // namespace ssemcp::tools
