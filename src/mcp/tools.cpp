#include "mcp/tools.hpp"

#include <utility>

namespace rx_host::mcp {

const char* to_string(const ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::kNetwork:
      return "network";
    case ToolErrorKind::kMalformedResponse:
      return "malformed_response";
    case ToolErrorKind::kQuery:
      return "query";
    case ToolErrorKind::kNotFound:
      return "not_found";
    case ToolErrorKind::kPermissionDenied:
      return "permission_denied";
    case ToolErrorKind::kIo:
      return "io";
    case ToolErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

void ToolRegistry::add(Tool tool) {
  if (tool.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!tool.handler) {
    throw std::invalid_argument("tool " + tool.name + " has no handler");
  }
  if (index_.find(tool.name) != index_.end()) {
    throw std::invalid_argument("duplicate tool name: " + tool.name);
  }

  index_.emplace(tool.name, tools_.size());
  tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tools_[it->second];
}

}  // namespace rx_host::mcp
