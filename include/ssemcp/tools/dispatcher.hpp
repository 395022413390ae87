#pragma once
#include "ssemcp/tools/registry.hpp"
#include "ssemcp/types.hpp"

#include <string>

namespace ssemcp::tools
{

/// Resolves a tool by name, validates its arguments, invokes it and wraps the
/// outcome as a tools/call result `{content: [...]}`.
///
/// Failures are thrown, never returned alongside partial content:
/// - NotFoundError: no tool with that name
/// - ValidationError: arguments not an object, or rejected by inputSchema
/// - ToolTimeoutError: the tool exceeded its timeout
/// - anything the tool itself throws
class ToolDispatcher
{
  public:
    explicit ToolDispatcher(const ToolRegistry& registry, bool validate_arguments = true)
        : registry_(registry), validate_arguments_(validate_arguments)
    {
    }

    ssemcp::Json dispatch(const std::string& name, const ssemcp::Json& arguments) const;

    /// Turn whatever a tool returned into an ordered array of content blocks.
    static ssemcp::Json normalize_content(const ssemcp::Json& result);

  private:
    const ToolRegistry& registry_;
    bool validate_arguments_;
};

} // namespace ssemcp::tools
