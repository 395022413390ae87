#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "ssemcp/tools/tool.hpp"

namespace ssemcp::tools {

// Append-only set of tools, populated once at startup and read-only afterwards
// (safe to share across sessions without locking).
class ToolRegistry {
 public:
  // Throws ConfigError if a tool with the same name is already registered.
  void register_tool(Tool t);

  // Tools in registration order.
  const std::vector<Tool>& list() const { return tools_; }

  // nullptr when no tool has that name.
  const Tool* resolve(const std::string& name) const;

  bool contains(const std::string& name) const { return index_.count(name) != 0; }
  size_t size() const { return tools_.size(); }

 private:
  std::vector<Tool> tools_;
  std::unordered_map<std::string, size_t> index_;
};

} // namespace ssemcp::tools
