#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace rx_host::mcp {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequestError("Request must be a JSON object", nullptr);
  }

  nlohmann::json id = nullptr;
  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!is_valid_id(*id_it)) {
      throw InvalidRequestError("JSON-RPC id must be string, integer, or null", nullptr);
    }
    id = *id_it;
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw InvalidRequestError("jsonrpc must be \"2.0\"", id);
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw InvalidRequestError("method must be a string", id);
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw InvalidRequestError("params must be an object or an array", id);
    }
    parsed.params = *params_it;
  }

  if (id_it != request.end()) {
    parsed.id = id;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

std::string serialize_frame(const nlohmann::json& message) {
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace rx_host::mcp
