#include "mcp/server.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcp/envelope.hpp"

namespace rx_host::mcp {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string describe_id(const nlohmann::json& id) {
  return id.is_null() ? std::string("-") : id.dump();
}

}  // namespace

const char* to_string(const CallState state) {
  switch (state) {
    case CallState::kReceived:
      return "RECEIVED";
    case CallState::kValidated:
      return "VALIDATED";
    case CallState::kExecuting:
      return "EXECUTING";
    case CallState::kSucceeded:
      return "SUCCEEDED";
    case CallState::kFailed:
      return "FAILED";
    case CallState::kResponded:
      return "RESPONDED";
  }
  return "UNKNOWN";
}

Server::Server(ToolRegistry tools, ServerOptions options) : tools_(std::move(tools)), options_(std::move(options)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (shutdown_requested()) {
      err << "rx-toolhost: shutdown requested; exiting cleanly\n";
      return 0;
    }
    if (is_blank(line)) {
      continue;
    }

    bool should_respond = true;
    nlohmann::json response;
    try {
      response = handle_line(line, should_respond, err);
    } catch (const std::exception& ex) {
      err << "rx-toolhost: failed to process request: " << ex.what() << '\n';
      response = make_error_response(nullptr, JsonRpcError{.code = kInternalError, .message = "internal error"});
    }

    if (should_respond) {
      // The frame is fully rendered before anything is written.
      const std::string frame = serialize_frame(response);
      out << frame << '\n';
      out.flush();
      if (!out) {
        err << "rx-toolhost: fatal: failed to write response to output stream\n";
        return 1;
      }
    }

    if (shutdown_requested()) {
      err << "rx-toolhost: shutdown requested; exiting cleanly\n";
      return 0;
    }
  }

  out.flush();
  // A shutdown signal interrupts a blocking read and surfaces here as a failed getline.
  if (shutdown_requested()) {
    in.clear();
    err << "rx-toolhost: shutdown requested; exiting cleanly\n";
    return 0;
  }
  if (in.bad()) {
    err << "rx-toolhost: fatal: input stream unreadable\n";
    return 1;
  }

  err << "rx-toolhost: input closed; exiting cleanly\n";
  return 0;
}

nlohmann::json Server::call_tool(const std::string& name, const nlohmann::json& arguments, std::ostream& err,
                                 const nlohmann::json& id) const {
  const auto started = std::chrono::steady_clock::now();
  auto state = CallState::kReceived;
  nlohmann::json envelope;
  std::string failure;
  const char* failure_kind = "tool";

  try {
    const Tool* tool = tools_.find(name);
    if (tool == nullptr) {
      failure = "unknown tool: " + name;
      failure_kind = "lookup";
    } else {
      const Arguments validated = tool->input_schema.validate(arguments);
      state = CallState::kValidated;

      const auto context = core::CallContext::with_timeout(options_.call_timeout, options_.cancel_token);
      state = CallState::kExecuting;
      envelope = make_success_envelope(tool->handler(validated, context));
      state = CallState::kSucceeded;
    }
  } catch (const ValidationError& ex) {
    failure = std::string("invalid arguments: ") + ex.what();
    failure_kind = "validation";
  } catch (const ToolError& ex) {
    failure = ex.what();
    failure_kind = to_string(ex.kind());
  } catch (const std::exception& ex) {
    failure = ex.what();
  } catch (...) {
    failure = "tool failed with a non-standard exception";
  }

  if (state != CallState::kSucceeded) {
    if (failure.empty()) {
      failure = "tool failed without a message";
    }
    state = CallState::kFailed;
    envelope = make_error_envelope(failure);
    err << "rx-toolhost: call " << name << " id=" << describe_id(id) << " failed (" << failure_kind
        << "): " << failure << '\n';
  }

  if (options_.log_calls) {
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    err << "rx-toolhost: call " << name << " id=" << describe_id(id) << ' ' << to_string(state) << " -> "
        << to_string(CallState::kResponded) << " elapsed_ms=" << elapsed.count() << '\n';
  }

  return envelope;
}

nlohmann::json Server::handle_line(const std::string& line, bool& should_respond, std::ostream& err) const {
  should_respond = true;
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    err << "rx-toolhost: undecodable request: " << ex.what() << '\n';
    return make_error_response(nullptr,
                               JsonRpcError{.code = kParseError, .message = std::string("parse error: ") + ex.what()});
  }

  JsonRpcRequest request;
  try {
    request = parse_request(message);
  } catch (const InvalidRequestError& ex) {
    err << "rx-toolhost: invalid request: " << ex.what() << '\n';
    return make_error_response(ex.id(), JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  }

  if (request.is_notification()) {
    should_respond = false;
    if (options_.log_calls) {
      err << "rx-toolhost: notification " << request.method << '\n';
    }
    return {};
  }

  return handle_request(request, err);
}

nlohmann::json Server::handle_request(const JsonRpcRequest& request, std::ostream& err) const {
  const nlohmann::json& id = *request.id;
  try {
    if (request.method == "initialize") {
      return make_result_response(id, handle_initialize(request.params));
    }
    if (request.method == "ping") {
      return make_result_response(id, nlohmann::json::object());
    }
    if (request.method == "tools/list") {
      return make_result_response(id, handle_tools_list());
    }
    if (request.method == "tools/call") {
      return make_result_response(id, handle_tools_call(request.params, id, err));
    }

    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "method not found: " + request.method});
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::exception& ex) {
    err << "rx-toolhost: " << request.method << " failed: " << ex.what() << '\n';
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = "internal error"});
  }
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  std::string protocol_version = kDefaultProtocolVersion;
  const auto version_it = params.find("protocolVersion");
  if (version_it != params.end() && version_it->is_string()) {
    protocol_version = version_it->get<std::string>();
  }

  return nlohmann::json{{"protocolVersion", protocol_version},
                        {"serverInfo", {{"name", options_.name}, {"version", options_.version}}},
                        {"capabilities", {{"tools", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_.tools()) {
    tools.push_back(
        {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema.to_json()}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params, const nlohmann::json& id,
                                         std::ostream& err) const {
  if (!params.is_object()) {
    err << "rx-toolhost: tools/call id=" << describe_id(id) << " rejected: params must be an object\n";
    return make_error_envelope("invalid tools/call request: params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    err << "rx-toolhost: tools/call id=" << describe_id(id) << " rejected: name must be a string\n";
    return make_error_envelope("invalid tools/call request: name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end() && !args_it->is_null()) {
    arguments = *args_it;
  }

  return call_tool(name_it->get<std::string>(), arguments, err, id);
}

bool Server::shutdown_requested() const {
  return options_.cancel_token != nullptr && options_.cancel_token->load();
}

}  // namespace rx_host::mcp
