#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "mcp/schema.hpp"

using rx_host::mcp::Arguments;
using rx_host::mcp::FieldType;
using rx_host::mcp::InputSchema;
using rx_host::mcp::ValidationError;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

InputSchema trial_search_schema() {
  InputSchema schema;
  schema.required("query", FieldType::kString, "Search query")
      .optional("max_items", FieldType::kInteger, "Maximum number of results", 10);
  return schema;
}

int test_missing_required_field_names_the_field() {
  try {
    trial_search_schema().validate(nlohmann::json{{"max_items", 5}});
  } catch (const ValidationError& ex) {
    if (ex.field() != "query") {
      return fail("test_missing_required_field_names_the_field", "wrong field reported");
    }
    if (std::string(ex.what()).find("query") == std::string::npos) {
      return fail("test_missing_required_field_names_the_field", "message does not mention the field");
    }
    return 0;
  }
  return fail("test_missing_required_field_names_the_field", "expected ValidationError");
}

int test_null_required_field_counts_as_missing() {
  try {
    trial_search_schema().validate(nlohmann::json{{"query", nullptr}});
  } catch (const ValidationError& ex) {
    return ex.field() == "query" ? 0 : fail("test_null_required_field_counts_as_missing", "wrong field");
  }
  return fail("test_null_required_field_counts_as_missing", "expected ValidationError");
}

int test_wrong_type_is_rejected() {
  try {
    trial_search_schema().validate(nlohmann::json{{"query", 42}});
    return fail("test_wrong_type_is_rejected", "numeric query should be rejected");
  } catch (const ValidationError& ex) {
    if (ex.field() != "query" || std::string(ex.what()).find("string") == std::string::npos) {
      return fail("test_wrong_type_is_rejected", "message should name field and expected type");
    }
  }

  try {
    trial_search_schema().validate(nlohmann::json{{"query", "asthma"}, {"max_items", "ten"}});
  } catch (const ValidationError& ex) {
    return ex.field() == "max_items" ? 0 : fail("test_wrong_type_is_rejected", "wrong field for max_items");
  }
  return fail("test_wrong_type_is_rejected", "string max_items should be rejected");
}

int test_fractional_integer_is_rejected() {
  try {
    trial_search_schema().validate(nlohmann::json{{"query", "asthma"}, {"max_items", 2.5}});
  } catch (const ValidationError&) {
    return 0;
  }
  return fail("test_fractional_integer_is_rejected", "2.5 is not an integer");
}

int test_integral_float_is_accepted_as_integer() {
  const auto args = trial_search_schema().validate(nlohmann::json{{"query", "asthma"}, {"max_items", 20.0}});
  if (args.get_integer("max_items") != 20) {
    return fail("test_integral_float_is_accepted_as_integer", "20.0 should validate as 20");
  }
  return 0;
}

int test_out_of_range_integers_are_rejected() {
  const auto schema = trial_search_schema();
  const nlohmann::json too_large[] = {nlohmann::json(1e30), nlohmann::json(-1e30), nlohmann::json(9223372036854775808.0),
                                      nlohmann::json(std::numeric_limits<std::uint64_t>::max())};
  for (const auto& value : too_large) {
    try {
      schema.validate(nlohmann::json{{"query", "asthma"}, {"max_items", value}});
      return fail("test_out_of_range_integers_are_rejected", "value outside int64 was accepted");
    } catch (const ValidationError& ex) {
      if (ex.field() != "max_items") {
        return fail("test_out_of_range_integers_are_rejected", "error should name max_items");
      }
    }
  }

  const auto largest = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  const auto args = schema.validate(nlohmann::json{{"query", "asthma"}, {"max_items", largest}});
  if (args.get_integer("max_items") != std::numeric_limits<std::int64_t>::max()) {
    return fail("test_out_of_range_integers_are_rejected", "int64 max should round-trip");
  }
  return 0;
}

int test_zero_and_omitted_numeric_are_equivalent() {
  const auto schema = trial_search_schema();
  const auto omitted = schema.validate(nlohmann::json{{"query", "diabetes"}});
  const auto zero = schema.validate(nlohmann::json{{"query", "diabetes"}, {"max_items", 0}});
  const auto null_value = schema.validate(nlohmann::json{{"query", "diabetes"}, {"max_items", nullptr}});

  if (omitted.get_integer("max_items") != 10) {
    return fail("test_zero_and_omitted_numeric_are_equivalent", "default not applied when omitted");
  }
  if (omitted.values() != zero.values() || omitted.values() != null_value.values()) {
    return fail("test_zero_and_omitted_numeric_are_equivalent", "zero or null should behave like omission");
  }
  return 0;
}

int test_explicit_value_overrides_default() {
  const auto args = trial_search_schema().validate(nlohmann::json{{"query", "diabetes"}, {"max_items", 25}});
  if (args.get_integer("max_items") != 25) {
    return fail("test_explicit_value_overrides_default", "explicit max_items lost");
  }
  return 0;
}

int test_unknown_fields_are_ignored() {
  const auto args =
      trial_search_schema().validate(nlohmann::json{{"query", "diabetes"}, {"sort", "date"}, {"debug", true}});
  if (args.has("sort") || args.has("debug")) {
    return fail("test_unknown_fields_are_ignored", "undeclared fields should not be retained");
  }
  if (args.get_string("query") != "diabetes") {
    return fail("test_unknown_fields_are_ignored", "declared field missing");
  }
  return 0;
}

int test_optional_without_default_stays_absent() {
  InputSchema schema;
  schema.required("directory", FieldType::kString, "Directory")
      .optional("pattern", FieldType::kString, "Glob")
      .optional("depth", FieldType::kNumber, "Depth");

  const auto args = schema.validate(nlohmann::json{{"directory", "/tmp"}, {"depth", 0}});
  if (args.has("pattern") || args.has("depth")) {
    return fail("test_optional_without_default_stays_absent", "absent optional fields should not appear");
  }
  if (args.get_string("pattern", "*") != "*") {
    return fail("test_optional_without_default_stays_absent", "fallback not returned");
  }
  return 0;
}

int test_boolean_fields() {
  InputSchema schema;
  schema.optional("recursive", FieldType::kBoolean, "Recurse", true);

  if (!schema.validate(nlohmann::json::object()).get_boolean("recursive")) {
    return fail("test_boolean_fields", "boolean default not applied");
  }
  if (schema.validate(nlohmann::json{{"recursive", false}}).get_boolean("recursive")) {
    return fail("test_boolean_fields", "explicit false must be kept");
  }
  try {
    schema.validate(nlohmann::json{{"recursive", 1}});
  } catch (const ValidationError&) {
    return 0;
  }
  return fail("test_boolean_fields", "number should not pass as boolean");
}

int test_non_object_arguments_rejected() {
  try {
    trial_search_schema().validate(nlohmann::json::array({"diabetes"}));
  } catch (const ValidationError&) {
    return 0;
  }
  return fail("test_non_object_arguments_rejected", "array arguments should be rejected");
}

int test_schema_document() {
  const auto document = trial_search_schema().to_json();
  if (document.at("type") != "object") {
    return fail("test_schema_document", "schema type must be object");
  }
  if (document.at("required") != nlohmann::json::array({"query"})) {
    return fail("test_schema_document", "required list mismatch");
  }
  const auto& max_items = document.at("properties").at("max_items");
  if (max_items.at("type") != "integer" || max_items.at("default") != 10) {
    return fail("test_schema_document", "max_items property mismatch");
  }
  return 0;
}

int test_duplicate_field_and_bad_default_rejected() {
  InputSchema schema;
  schema.required("sql", FieldType::kString, "SQL");
  try {
    schema.optional("sql", FieldType::kString, "again");
    return fail("test_duplicate_field_and_bad_default_rejected", "duplicate field accepted");
  } catch (const std::invalid_argument&) {
  }

  try {
    schema.optional("limit", FieldType::kInteger, "Limit", "five");
    return fail("test_duplicate_field_and_bad_default_rejected", "mistyped default accepted");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_missing_required_field_names_the_field(); rc != 0) return rc;
  if (int rc = test_null_required_field_counts_as_missing(); rc != 0) return rc;
  if (int rc = test_wrong_type_is_rejected(); rc != 0) return rc;
  if (int rc = test_fractional_integer_is_rejected(); rc != 0) return rc;
  if (int rc = test_integral_float_is_accepted_as_integer(); rc != 0) return rc;
  if (int rc = test_out_of_range_integers_are_rejected(); rc != 0) return rc;
  if (int rc = test_zero_and_omitted_numeric_are_equivalent(); rc != 0) return rc;
  if (int rc = test_explicit_value_overrides_default(); rc != 0) return rc;
  if (int rc = test_unknown_fields_are_ignored(); rc != 0) return rc;
  if (int rc = test_optional_without_default_stays_absent(); rc != 0) return rc;
  if (int rc = test_boolean_fields(); rc != 0) return rc;
  if (int rc = test_non_object_arguments_rejected(); rc != 0) return rc;
  if (int rc = test_schema_document(); rc != 0) return rc;
  if (int rc = test_duplicate_field_and_bad_default_rejected(); rc != 0) return rc;

  std::cout << "[PASS] schema unit tests\n";
  return 0;
}
