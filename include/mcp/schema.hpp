#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace rx_host::mcp {

enum class FieldType { kString, kInteger, kNumber, kBoolean };

const char* to_string(FieldType type);

struct FieldSpec {
  std::string name;
  FieldType type;
  std::string description;
  bool required{false};
  // Applied when an optional field is absent, null, or a numeric zero.
  nlohmann::json default_value{};
};

class ValidationError : public std::invalid_argument {
 public:
  ValidationError(std::string field, const std::string& message)
      : std::invalid_argument(message), field_(std::move(field)) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

// Arguments that passed schema validation, with defaults applied. Only
// declared fields are retained.
class Arguments {
 public:
  Arguments() = default;
  explicit Arguments(nlohmann::json values) : values_(std::move(values)) {}

  bool has(const std::string& name) const;

  const std::string& get_string(const std::string& name) const;
  std::string get_string(const std::string& name, const std::string& fallback) const;
  std::int64_t get_integer(const std::string& name) const;
  double get_number(const std::string& name) const;
  bool get_boolean(const std::string& name) const;

  const nlohmann::json& values() const { return values_; }

 private:
  const nlohmann::json& at(const std::string& name) const;

  nlohmann::json values_ = nlohmann::json::object();
};

class InputSchema {
 public:
  InputSchema& required(std::string name, FieldType type, std::string description);
  InputSchema& optional(std::string name, FieldType type, std::string description,
                        nlohmann::json default_value = nullptr);

  // Checks required fields and the types of present fields. Unknown
  // fields are ignored. Throws ValidationError naming the offending field.
  Arguments validate(const nlohmann::json& raw) const;

  // JSON Schema document advertised through tools/list.
  nlohmann::json to_json() const;

  const std::vector<FieldSpec>& fields() const { return fields_; }

 private:
  InputSchema& add(FieldSpec field);

  std::vector<FieldSpec> fields_;
};

}  // namespace rx_host::mcp
