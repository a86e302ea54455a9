#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rx_host::core {
namespace {

const std::vector<std::string>& known_tool_families() {
  static const std::vector<std::string> kFamilies = {"external-api", "database", "filesystem"};
  return kFamilies;
}

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::chrono::milliseconds parse_duration_ms(const std::string& key, const std::string& value) {
  long long parsed = 0;
  try {
    std::size_t consumed = 0;
    parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer number of milliseconds");
  }

  if (parsed < 0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return std::chrono::milliseconds(parsed);
}

// '#' opens a comment at the start of a line or after whitespace, so values
// such as passwords in database.url may contain it.
std::size_t comment_start(const std::string& line) {
  for (std::size_t pos = line.find('#'); pos != std::string::npos; pos = line.find('#', pos + 1)) {
    if (pos == 0 || std::isspace(static_cast<unsigned char>(line[pos - 1])) != 0) {
      return pos;
    }
  }
  return line.size();
}

void apply_key_value(HostConfig& config, const std::string& key, const std::string& value) {
  if (key == "server.name") {
    config.server_name = value;
    return;
  }

  if (key == "server.version") {
    config.server_version = value;
    return;
  }

  if (key == "server.tools") {
    config.tool_families = parse_tool_families(value);
    return;
  }

  if (key == "call.timeout_ms") {
    config.call_timeout = parse_duration_ms(key, value);
    return;
  }

  if (key == "log.calls") {
    config.log_calls = parse_bool(value);
    return;
  }

  if (key == "http.user_agent") {
    config.http.user_agent = value;
    return;
  }

  if (key == "http.connect_timeout_ms") {
    config.http.connect_timeout = parse_duration_ms(key, value);
    return;
  }

  if (key == "external_api.clinical_trials_url") {
    config.external_api.clinical_trials_url = value;
    return;
  }

  if (key == "external_api.fda_label_url") {
    config.external_api.fda_label_url = value;
    return;
  }

  if (key == "database.url") {
    config.database.url = value;
  }
}

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

}  // namespace

std::vector<std::string> parse_tool_families(const std::string& value) {
  std::vector<std::string> families;
  std::stringstream input(value);
  std::string item;
  while (std::getline(input, item, ',')) {
    item = trim(item);
    if (item.empty()) {
      continue;
    }

    const auto& known = known_tool_families();
    if (std::find(known.begin(), known.end(), item) == known.end()) {
      throw std::runtime_error("unknown tool family: " + item);
    }
    if (std::find(families.begin(), families.end(), item) == families.end()) {
      families.push_back(item);
    }
  }

  if (families.empty()) {
    throw std::runtime_error("at least one tool family must be enabled");
  }
  return families;
}

bool has_tool_family(const HostConfig& config, const std::string& family) {
  return std::find(config.tool_families.begin(), config.tool_families.end(), family) != config.tool_families.end();
}

HostConfig load_host_config(const std::string& path) {
  HostConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    line.erase(comment_start(line));

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(HostConfig& config) {
  if (const auto url = getenv_or("DATABASE_URL", ""); !url.empty()) {
    config.database.url = url;
  }

  if (const auto* tools = std::getenv("RX_TOOLHOST_TOOLS"); tools != nullptr) {
    config.tool_families = parse_tool_families(tools);
  }
  if (const auto* timeout = std::getenv("RX_TOOLHOST_CALL_TIMEOUT_MS"); timeout != nullptr) {
    config.call_timeout = parse_duration_ms("RX_TOOLHOST_CALL_TIMEOUT_MS", timeout);
  }
  if (const auto* log_calls = std::getenv("RX_TOOLHOST_LOG_CALLS"); log_calls != nullptr) {
    config.log_calls = parse_bool(log_calls);
  }
}

}  // namespace rx_host::core
