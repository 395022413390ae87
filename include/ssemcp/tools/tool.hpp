#pragma once
#include "ssemcp/types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace ssemcp::tools
{

/// Immutable tool descriptor bound to its implementation.
///
/// The implementation receives the (already defaulted) arguments object and
/// returns either a content array, a single content block, a string, or any
/// other JSON value; the dispatcher normalizes all of them into content blocks.
/// Implementations report failure by throwing.
class Tool
{
  public:
    using Fn = std::function<ssemcp::Json(const ssemcp::Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, ssemcp::Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const ssemcp::Json& input_schema() const
    {
        return input_schema_;
    }
    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

    /// Set a maximum run time; zero disables the limit.
    Tool& set_timeout(std::chrono::milliseconds timeout)
    {
        timeout_ = timeout;
        return *this;
    }

    /// Run the implementation. With a timeout set and `enforce_timeout` true the
    /// call runs on a detached worker and throws ToolTimeoutError if it does not
    /// finish in time; the late result is discarded.
    ssemcp::Json invoke(const ssemcp::Json& input, bool enforce_timeout = true) const;

    /// {name, description, inputSchema} as advertised by tools/list.
    ssemcp::Json descriptor() const;

  private:
    std::string name_;
    std::string description_;
    ssemcp::Json input_schema_;
    Fn fn_;
    std::chrono::milliseconds timeout_{0};
};

} // namespace ssemcp::tools
