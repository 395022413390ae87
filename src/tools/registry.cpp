#include "ssemcp/tools/registry.hpp"

#include "ssemcp/exceptions.hpp"

namespace ssemcp::tools {

void ToolRegistry::register_tool(Tool t) {
  if (t.name().empty()) throw ssemcp::ConfigError("tool name must not be empty");
  if (contains(t.name()))
    throw ssemcp::ConfigError("duplicate tool name: " + t.name());
  index_.emplace(t.name(), tools_.size());
  tools_.push_back(std::move(t));
}

const Tool* ToolRegistry::resolve(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return nullptr;
  return &tools_[it->second];
}

} // namespace ssemcp::tools
