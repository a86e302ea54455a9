#include "mcp/envelope.hpp"

#include "mcp/jsonrpc.hpp"

namespace rx_host::mcp {

namespace {

nlohmann::json text_content(const std::string& text) {
  return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

}  // namespace

nlohmann::json make_success_envelope(const nlohmann::json& value) {
  const std::string text = value.is_string() ? value.get<std::string>() : serialize_frame(value);
  return nlohmann::json{{"content", text_content(text)}, {"isError", false}};
}

nlohmann::json make_error_envelope(const std::string& message) {
  return nlohmann::json{{"content", text_content(message)}, {"isError", true}};
}

bool is_error_envelope(const nlohmann::json& envelope) {
  const auto it = envelope.find("isError");
  return it != envelope.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace rx_host::mcp
