#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rx_host::core {

struct HttpConfig {
  std::string user_agent{"rx-toolhost/0.1.0"};
  std::chrono::milliseconds connect_timeout{0};
};

struct ExternalApiConfig {
  std::string clinical_trials_url{"https://clinicaltrials.gov/api/v2/studies"};
  std::string fda_label_url{"https://api.fda.gov/drug/label.json"};
};

struct DatabaseConfig {
  std::string url{"host=localhost port=5432 user=postgres password=postgres dbname=clinical_trials sslmode=disable"};
};

struct HostConfig {
  std::string server_name{"rx-toolhost"};
  std::string server_version{"0.1.0"};
  std::vector<std::string> tool_families{"external-api", "database", "filesystem"};
  // Zero means a call waits for its downstream I/O indefinitely.
  std::chrono::milliseconds call_timeout{0};
  bool log_calls{false};
  HttpConfig http{};
  ExternalApiConfig external_api{};
  DatabaseConfig database{};
};

HostConfig load_host_config(const std::string& path);

void apply_env_overrides(HostConfig& config);

// Parses a comma separated family list and rejects unknown or empty input.
std::vector<std::string> parse_tool_families(const std::string& value);

bool has_tool_family(const HostConfig& config, const std::string& family);

}  // namespace rx_host::core
