#include "tools/external_api.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace rx_host::tools {

namespace {

nlohmann::json fetch_json(net::HttpClient& client, const std::string& url, const char* service,
                          const core::CallContext& context) {
  context.check(service);

  net::HttpResponse response;
  try {
    response = client.get(url, context);
  } catch (const net::HttpError& ex) {
    const auto kind = ex.cancelled() ? mcp::ToolErrorKind::kCancelled : mcp::ToolErrorKind::kNetwork;
    throw mcp::ToolError(kind, std::string("Failed to query ") + service + ": " + ex.what());
  }

  auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    throw mcp::ToolError(mcp::ToolErrorKind::kMalformedResponse,
                         "Failed to parse API response: body is not valid JSON (HTTP " +
                             std::to_string(response.status) + ")");
  }
  if (!parsed.is_object()) {
    throw mcp::ToolError(mcp::ToolErrorKind::kMalformedResponse,
                         "Failed to parse API response: expected a JSON object (HTTP " +
                             std::to_string(response.status) + ")");
  }
  return parsed;
}

nlohmann::json field_or_null(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? nlohmann::json(nullptr) : *it;
}

nlohmann::json search_clinical_trials(net::HttpClient& client, const ExternalApiOptions& options,
                                      const mcp::Arguments& args, const core::CallContext& context) {
  const auto& query = args.get_string("query");
  const auto max_items = args.get_integer("max_items");

  const auto url = net::build_url(options.clinical_trials_url, {{"format", "json"},
                                                                {"pageSize", std::to_string(max_items)},
                                                                {"query.term", query}});
  const auto body = fetch_json(client, url, "ClinicalTrials.gov", context);

  return nlohmann::json{{"query", query},
                        {"count", field_or_null(body, "totalCount")},
                        {"studies", field_or_null(body, "studies")}};
}

nlohmann::json search_fda_drugs(net::HttpClient& client, const ExternalApiOptions& options,
                                const mcp::Arguments& args, const core::CallContext& context) {
  const auto& drug_name = args.get_string("drug_name");

  const auto url = net::build_url(options.fda_label_url, {{"limit", std::to_string(kFdaResultLimit)},
                                                          {"search", "openfda.brand_name:\"" + drug_name + "\""}});
  const auto body = fetch_json(client, url, "FDA API", context);

  return nlohmann::json{{"drug_name", drug_name}, {"results", field_or_null(body, "results")}};
}

}  // namespace

void register_external_api_tools(mcp::ToolRegistry& registry, std::shared_ptr<net::HttpClient> client,
                                 ExternalApiOptions options) {
  if (client == nullptr) {
    throw std::invalid_argument("external API tools require an HTTP client");
  }
  auto shared_options = std::make_shared<const ExternalApiOptions>(std::move(options));

  mcp::InputSchema trials_schema;
  trials_schema
      .required("query", mcp::FieldType::kString, "Search query (e.g., disease name, intervention, sponsor)")
      .optional("max_items", mcp::FieldType::kInteger, "Maximum number of results to return (default: 10)",
                kDefaultTrialPageSize);

  registry.add(mcp::Tool{.name = "search_clinical_trials",
                         .description = "Search ClinicalTrials.gov database for clinical studies",
                         .input_schema = std::move(trials_schema),
                         .handler = [client, shared_options](const mcp::Arguments& args,
                                                             const core::CallContext& context) {
                           return search_clinical_trials(*client, *shared_options, args, context);
                         }});

  mcp::InputSchema fda_schema;
  fda_schema.required("drug_name", mcp::FieldType::kString, "Drug brand name to search for");

  registry.add(mcp::Tool{.name = "search_fda_drugs",
                         .description = "Search FDA drug database for drug labels and information",
                         .input_schema = std::move(fda_schema),
                         .handler = [client, shared_options](const mcp::Arguments& args,
                                                             const core::CallContext& context) {
                           return search_fda_drugs(*client, *shared_options, args, context);
                         }});
}

}  // namespace rx_host::tools
