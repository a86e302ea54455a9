#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace rx_host::mcp {

// Every handler result is stringified into a single text content item so
// all tools share one response shape.
nlohmann::json make_success_envelope(const nlohmann::json& value);
nlohmann::json make_error_envelope(const std::string& message);

bool is_error_envelope(const nlohmann::json& envelope);

}  // namespace rx_host::mcp
