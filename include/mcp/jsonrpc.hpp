#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace rx_host::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  bool is_notification() const { return !id.has_value(); }
};

// Raised for requests that are valid JSON but not valid JSON-RPC. Carries
// the request id when it could still be recovered.
class InvalidRequestError : public std::invalid_argument {
 public:
  InvalidRequestError(const std::string& message, nlohmann::json id)
      : std::invalid_argument(message), id_(std::move(id)) {}

  const nlohmann::json& id() const { return id_; }

 private:
  nlohmann::json id_;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

// Serializes one frame. Invalid UTF-8 is replaced instead of throwing so a
// payload can never break the framing.
std::string serialize_frame(const nlohmann::json& message);

}  // namespace rx_host::mcp
