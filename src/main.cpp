#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <signal.h>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "net/http_client.hpp"
#include "tools/database.hpp"
#include "tools/external_api.hpp"
#include "tools/filesystem.hpp"

namespace {

std::atomic_bool* g_cancel_flag = nullptr;

void handle_shutdown_signal(int /*signal*/) {
  if (g_cancel_flag != nullptr) {
    g_cancel_flag->store(true);
  }
}

// No SA_RESTART: a blocking read on stdin must return EINTR so the server loop
// sees the shutdown flag.
void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, nullptr);
}

struct CommandLine {
  std::string config_path{};
  std::string tools{};
};

CommandLine parse_command_line(int argc, char** argv) {
  CommandLine command_line;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--tools") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--tools requires a comma separated list");
      }
      command_line.tools = argv[++i];
    } else if (arg.rfind("--tools=", 0) == 0) {
      command_line.tools = arg.substr(std::string("--tools=").size());
    } else if (!arg.empty() && arg.front() == '-') {
      throw std::runtime_error("unknown option: " + arg);
    } else {
      command_line.config_path = arg;
    }
  }
  return command_line;
}

std::string format_config_settings(const rx_host::core::HostConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "rx-toolhost: config=" << (config_path.empty() ? "<defaults>" : config_path)
         << " | server=" << config.server_name << '/' << config.server_version << " | tools=";
  for (std::size_t i = 0; i < config.tool_families.size(); ++i) {
    output << (i == 0 ? "" : ",") << config.tool_families[i];
  }
  output << " | call_timeout_ms=" << config.call_timeout.count()
         << " | log_calls=" << (config.log_calls ? "true" : "false");
  return output.str();
}

rx_host::mcp::ToolRegistry build_registry(const rx_host::core::HostConfig& config) {
  using rx_host::core::has_tool_family;

  rx_host::mcp::ToolRegistry registry;

  if (has_tool_family(config, "external-api")) {
    auto client = std::make_shared<rx_host::net::CurlHttpClient>(rx_host::net::CurlOptions{
        .user_agent = config.http.user_agent, .connect_timeout = config.http.connect_timeout});
    rx_host::tools::register_external_api_tools(
        registry, client,
        rx_host::tools::ExternalApiOptions{.clinical_trials_url = config.external_api.clinical_trials_url,
                                           .fda_label_url = config.external_api.fda_label_url});
  }

  if (has_tool_family(config, "database")) {
    auto database = std::make_shared<rx_host::tools::PgDatabase>(config.database.url);
    if (const auto error = database->ping(); !error.empty()) {
      std::cerr << "rx-toolhost: warning: database not reachable: " << error << '\n';
    }
    rx_host::tools::register_database_tools(registry, database);
  }

  if (has_tool_family(config, "filesystem")) {
    rx_host::tools::register_filesystem_tools(registry);
  }

  return registry;
}

}  // namespace

int main(int argc, char** argv) {
  auto cancel_flag = std::make_shared<std::atomic_bool>(false);
  g_cancel_flag = cancel_flag.get();
  install_signal_handlers();

  std::string config_path;
  rx_host::core::HostConfig config{};
  try {
    const auto command_line = parse_command_line(argc, argv);
    config_path = command_line.config_path;
    if (!config_path.empty()) {
      config = rx_host::core::load_host_config(config_path);
    }
    rx_host::core::apply_env_overrides(config);
    if (!command_line.tools.empty()) {
      config.tool_families = rx_host::core::parse_tool_families(command_line.tools);
    }
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  rx_host::mcp::ToolRegistry registry;
  try {
    registry = build_registry(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  for (const auto& tool : registry.tools()) {
    std::cerr << "rx-toolhost: registered tool " << tool.name << '\n';
  }

  rx_host::mcp::Server server(std::move(registry),
                              rx_host::mcp::ServerOptions{.name = config.server_name,
                                                          .version = config.server_version,
                                                          .call_timeout = config.call_timeout,
                                                          .log_calls = config.log_calls,
                                                          .cancel_token = cancel_flag});
  return server.run(std::cin, std::cout, std::cerr);
}
