#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "mcp/tools.hpp"
#include "net/http_client.hpp"

namespace rx_host::tools {

struct ExternalApiOptions {
  std::string clinical_trials_url{"https://clinicaltrials.gov/api/v2/studies"};
  std::string fda_label_url{"https://api.fda.gov/drug/label.json"};
};

constexpr std::int64_t kDefaultTrialPageSize = 10;
constexpr int kFdaResultLimit = 5;

// Registers search_clinical_trials and search_fda_drugs. The registry's
// tools share ownership of the client.
void register_external_api_tools(mcp::ToolRegistry& registry, std::shared_ptr<net::HttpClient> client,
                                 ExternalApiOptions options = {});

}  // namespace rx_host::tools
