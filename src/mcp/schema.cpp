#include "mcp/schema.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace rx_host::mcp {

namespace {

bool is_numeric(const FieldType type) {
  return type == FieldType::kInteger || type == FieldType::kNumber;
}

bool is_integral(const nlohmann::json& value) {
  if (value.is_number_integer() || value.is_number_unsigned()) {
    return true;
  }
  if (value.is_number_float()) {
    const double raw = value.get<double>();
    return std::isfinite(raw) && std::floor(raw) == raw;
  }
  return false;
}

// Integral values must fit in a signed 64-bit integer.
bool in_integer_range(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  }
  if (value.is_number_float()) {
    constexpr double kLimit = 9223372036854775808.0;  // 2^63
    const double raw = value.get<double>();
    return raw >= -kLimit && raw < kLimit;
  }
  return true;
}

bool matches_type(const nlohmann::json& value, const FieldType type) {
  switch (type) {
    case FieldType::kString:
      return value.is_string();
    case FieldType::kInteger:
      return is_integral(value);
    case FieldType::kNumber:
      return value.is_number();
    case FieldType::kBoolean:
      return value.is_boolean();
  }
  return false;
}

// Zero stands for "unset" on optional numeric fields, the same as an
// omitted field.
bool is_zero(const nlohmann::json& value) {
  return value.is_number() && value.get<double>() == 0.0;
}

nlohmann::json normalize(const nlohmann::json& value, const FieldType type) {
  if (type == FieldType::kInteger && value.is_number_float()) {
    return static_cast<std::int64_t>(value.get<double>());
  }
  if (type == FieldType::kInteger && value.is_number_unsigned()) {
    return static_cast<std::int64_t>(value.get<std::uint64_t>());
  }
  return value;
}

}  // namespace

const char* to_string(const FieldType type) {
  switch (type) {
    case FieldType::kString:
      return "string";
    case FieldType::kInteger:
      return "integer";
    case FieldType::kNumber:
      return "number";
    case FieldType::kBoolean:
      return "boolean";
  }
  return "unknown";
}

bool Arguments::has(const std::string& name) const {
  return values_.contains(name);
}

const nlohmann::json& Arguments::at(const std::string& name) const {
  const auto it = values_.find(name);
  if (it == values_.end()) {
    throw std::out_of_range("argument not set: " + name);
  }
  return *it;
}

const std::string& Arguments::get_string(const std::string& name) const {
  return at(name).get_ref<const std::string&>();
}

std::string Arguments::get_string(const std::string& name, const std::string& fallback) const {
  return has(name) ? get_string(name) : fallback;
}

std::int64_t Arguments::get_integer(const std::string& name) const {
  return at(name).get<std::int64_t>();
}

double Arguments::get_number(const std::string& name) const {
  return at(name).get<double>();
}

bool Arguments::get_boolean(const std::string& name) const {
  return at(name).get<bool>();
}

InputSchema& InputSchema::required(std::string name, const FieldType type, std::string description) {
  return add(FieldSpec{.name = std::move(name),
                       .type = type,
                       .description = std::move(description),
                       .required = true,
                       .default_value = nullptr});
}

InputSchema& InputSchema::optional(std::string name, const FieldType type, std::string description,
                                   nlohmann::json default_value) {
  if (!default_value.is_null() && !matches_type(default_value, type)) {
    throw std::invalid_argument("default for " + name + " must be of type " + to_string(type));
  }
  return add(FieldSpec{.name = std::move(name),
                       .type = type,
                       .description = std::move(description),
                       .required = false,
                       .default_value = std::move(default_value)});
}

InputSchema& InputSchema::add(FieldSpec field) {
  for (const auto& existing : fields_) {
    if (existing.name == field.name) {
      throw std::invalid_argument("duplicate schema field: " + field.name);
    }
  }
  fields_.push_back(std::move(field));
  return *this;
}

Arguments InputSchema::validate(const nlohmann::json& raw) const {
  if (!raw.is_null() && !raw.is_object()) {
    throw ValidationError("", "arguments must be an object");
  }

  nlohmann::json values = nlohmann::json::object();
  for (const auto& field : fields_) {
    const nlohmann::json* present = nullptr;
    if (raw.is_object()) {
      const auto it = raw.find(field.name);
      if (it != raw.end() && !it->is_null()) {
        present = &*it;
      }
    }

    if (present == nullptr) {
      if (field.required) {
        throw ValidationError(field.name, "missing required argument: " + field.name);
      }
      if (!field.default_value.is_null()) {
        values[field.name] = field.default_value;
      }
      continue;
    }

    if (!matches_type(*present, field.type)) {
      throw ValidationError(field.name,
                            "argument " + field.name + " must be of type " + to_string(field.type));
    }
    if (field.type == FieldType::kInteger && !in_integer_range(*present)) {
      throw ValidationError(field.name, "argument " + field.name + " is out of range for integer");
    }

    if (!field.required && is_numeric(field.type) && is_zero(*present)) {
      if (!field.default_value.is_null()) {
        values[field.name] = field.default_value;
      }
      continue;
    }

    values[field.name] = normalize(*present, field.type);
  }

  return Arguments(std::move(values));
}

nlohmann::json InputSchema::to_json() const {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();

  for (const auto& field : fields_) {
    nlohmann::json property{{"type", to_string(field.type)}, {"description", field.description}};
    if (!field.default_value.is_null()) {
      property["default"] = field.default_value;
    }
    properties[field.name] = std::move(property);
    if (field.required) {
      required.push_back(field.name);
    }
  }

  return nlohmann::json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

}  // namespace rx_host::mcp
