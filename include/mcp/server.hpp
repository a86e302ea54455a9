#pragma once

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace rx_host::mcp {

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

struct ServerOptions {
  std::string name{"rx-toolhost"};
  std::string version{"0.1.0"};
  // Zero leaves calls unbounded.
  std::chrono::milliseconds call_timeout{0};
  bool log_calls{false};
  // Raised from outside to cancel the in-flight call and stop the loop
  // after its response is written.
  std::shared_ptr<std::atomic_bool> cancel_token{};
};

// Lifecycle of a single tools/call. SUCCEEDED and FAILED both always end in
// RESPONDED.
enum class CallState { kReceived, kValidated, kExecuting, kSucceeded, kFailed, kResponded };

const char* to_string(CallState state);

class Server {
 public:
  explicit Server(ToolRegistry tools, ServerOptions options = {});

  // Serves newline-delimited JSON-RPC until the input closes. Returns 0 on
  // a clean shutdown and 1 on a fatal transport error.
  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Runs one tool call to completion and returns its envelope. Never throws.
  nlohmann::json call_tool(const std::string& name, const nlohmann::json& arguments, std::ostream& err,
                           const nlohmann::json& id = nullptr) const;

  const ToolRegistry& tools() const { return tools_; }

 private:
  nlohmann::json handle_line(const std::string& line, bool& should_respond, std::ostream& err) const;
  nlohmann::json handle_request(const JsonRpcRequest& request, std::ostream& err) const;
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params, const nlohmann::json& id, std::ostream& err) const;

  bool shutdown_requested() const;

  ToolRegistry tools_;
  ServerOptions options_;
};

}  // namespace rx_host::mcp
