#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/call_context.hpp"
#include "mcp/schema.hpp"

namespace rx_host::mcp {

enum class ToolErrorKind {
  kNetwork,
  kMalformedResponse,
  kQuery,
  kNotFound,
  kPermissionDenied,
  kIo,
  kCancelled,
};

const char* to_string(ToolErrorKind kind);

// Typed failure raised by a handler. The message is passed through to the
// caller verbatim in the error envelope.
class ToolError : public std::runtime_error {
 public:
  ToolError(ToolErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  ToolErrorKind kind() const { return kind_; }

 private:
  ToolErrorKind kind_;
};

using ToolHandler = std::function<nlohmann::json(const Arguments&, const core::CallContext&)>;

struct Tool {
  std::string name;
  std::string description;
  InputSchema input_schema;
  ToolHandler handler;
};

// Name to tool mapping, filled once at startup. Lookups afterwards are
// read-only and preserve registration order for tools/list.
class ToolRegistry {
 public:
  // Throws std::invalid_argument on a duplicate or empty name, or a tool
  // without a handler.
  void add(Tool tool);

  const Tool* find(const std::string& name) const;

  const std::vector<Tool>& tools() const { return tools_; }
  std::size_t size() const { return tools_.size(); }
  bool empty() const { return tools_.empty(); }

 private:
  std::vector<Tool> tools_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace rx_host::mcp
