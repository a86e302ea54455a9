#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "core/config.hpp"

using rx_host::core::HostConfig;
using rx_host::core::apply_env_overrides;
using rx_host::core::has_tool_family;
using rx_host::core::load_host_config;
using rx_host::core::parse_tool_families;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".yaml");
  std::ofstream out(path);
  out << content;
  return path;
}

int test_defaults_wait_indefinitely() {
  const HostConfig config{};
  if (config.call_timeout.count() != 0) {
    return fail("test_defaults_wait_indefinitely", "default call timeout must be unbounded");
  }
  if (config.tool_families.size() != 3 || !has_tool_family(config, "database")) {
    return fail("test_defaults_wait_indefinitely", "all tool families should be enabled by default");
  }
  return 0;
}

int test_nested_sections_are_parsed() {
  const auto path = write_config("rx_toolhost_config",
                                 "server:\n"
                                 "  name: clinical-trial-filesystem  # inline comment\n"
                                 "  tools: filesystem, external-api\n"
                                 "call:\n"
                                 "  timeout_ms: 1500\n"
                                 "log:\n"
                                 "  calls: yes\n"
                                 "external_api:\n"
                                 "  clinical_trials_url: http://localhost:8080/studies\n"
                                 "database:\n"
                                 "  url: host=db port=5433 dbname=trials\n");
  const auto config = load_host_config(path.string());
  std::filesystem::remove(path);

  if (config.server_name != "clinical-trial-filesystem") {
    return fail("test_nested_sections_are_parsed", "server.name mismatch");
  }
  if (config.tool_families != std::vector<std::string>{"filesystem", "external-api"}) {
    return fail("test_nested_sections_are_parsed", "server.tools mismatch");
  }
  if (config.call_timeout.count() != 1500 || !config.log_calls) {
    return fail("test_nested_sections_are_parsed", "call/log settings mismatch");
  }
  if (config.external_api.clinical_trials_url != "http://localhost:8080/studies") {
    return fail("test_nested_sections_are_parsed", "values containing ':' must be kept whole");
  }
  if (config.database.url != "host=db port=5433 dbname=trials") {
    return fail("test_nested_sections_are_parsed", "database.url mismatch");
  }
  return 0;
}

int test_hash_inside_value_is_kept() {
  const auto path = write_config("rx_toolhost_hash",
                                 "# connection settings\n"
                                 "database:\n"
                                 "  # credentials\n"
                                 "  url: postgres://app:s3cr#t@db:5432/trials?sslmode=disable # primary\n");
  const auto config = load_host_config(path.string());
  std::filesystem::remove(path);

  if (config.database.url != "postgres://app:s3cr#t@db:5432/trials?sslmode=disable") {
    return fail("test_hash_inside_value_is_kept", "'#' inside a value should not start a comment");
  }
  return 0;
}

int test_invalid_values_are_rejected() {
  const auto negative = write_config("rx_toolhost_negative", "call:\n  timeout_ms: -5\n");
  const auto unknown = write_config("rx_toolhost_unknown", "server:\n  tools: filesystem,email\n");

  bool negative_rejected = false;
  bool unknown_rejected = false;
  try {
    load_host_config(negative.string());
  } catch (const std::runtime_error&) {
    negative_rejected = true;
  }
  try {
    load_host_config(unknown.string());
  } catch (const std::runtime_error&) {
    unknown_rejected = true;
  }
  std::filesystem::remove(negative);
  std::filesystem::remove(unknown);

  if (!negative_rejected || !unknown_rejected) {
    return fail("test_invalid_values_are_rejected", "negative timeout and unknown family must be rejected");
  }

  try {
    parse_tool_families(" , ");
  } catch (const std::runtime_error&) {
    return 0;
  }
  return fail("test_invalid_values_are_rejected", "empty family list must be rejected");
}

int test_missing_file_is_an_error() {
  try {
    load_host_config("/nonexistent/rx-toolhost.yaml");
  } catch (const std::runtime_error&) {
    return 0;
  }
  return fail("test_missing_file_is_an_error", "expected unable to open error");
}

int test_environment_overrides() {
  ::setenv("DATABASE_URL", "host=override dbname=trials", 1);
  ::setenv("RX_TOOLHOST_TOOLS", "database", 1);
  ::setenv("RX_TOOLHOST_CALL_TIMEOUT_MS", "250", 1);
  ::setenv("RX_TOOLHOST_LOG_CALLS", "true", 1);

  HostConfig config{};
  apply_env_overrides(config);

  ::unsetenv("DATABASE_URL");
  ::unsetenv("RX_TOOLHOST_TOOLS");
  ::unsetenv("RX_TOOLHOST_CALL_TIMEOUT_MS");
  ::unsetenv("RX_TOOLHOST_LOG_CALLS");

  if (config.database.url != "host=override dbname=trials") {
    return fail("test_environment_overrides", "DATABASE_URL should override database.url");
  }
  if (config.tool_families != std::vector<std::string>{"database"} || config.call_timeout.count() != 250 ||
      !config.log_calls) {
    return fail("test_environment_overrides", "RX_TOOLHOST_* overrides not applied");
  }

  ::setenv("DATABASE_URL", "", 1);
  HostConfig untouched{};
  apply_env_overrides(untouched);
  ::unsetenv("DATABASE_URL");
  if (untouched.database.url != HostConfig{}.database.url) {
    return fail("test_environment_overrides", "empty DATABASE_URL should keep the configured value");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_defaults_wait_indefinitely(); rc != 0) return rc;
  if (int rc = test_nested_sections_are_parsed(); rc != 0) return rc;
  if (int rc = test_hash_inside_value_is_kept(); rc != 0) return rc;
  if (int rc = test_invalid_values_are_rejected(); rc != 0) return rc;
  if (int rc = test_missing_file_is_an_error(); rc != 0) return rc;
  if (int rc = test_environment_overrides(); rc != 0) return rc;

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
