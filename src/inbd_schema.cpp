/******************************************************************************
 * OpenHD
 *
 * Licensed under the GNU General Public License (GPL) Version 3.
 *
 * This software is provided "as-is," without warranty of any kind, express or
 * implied, including but not limited to the warranties of merchantability,
 * fitness for a particular purpose, and non-infringement. For details, see the
 * full license in the LICENSE file provided with this source code.
 *
 * Non-Military Use Only:
 * This software and its associated components are explicitly intended for
 * civilian and non-military purposes. Use in any military or defense
 * applications is strictly prohibited unless explicitly and individually
 * licensed otherwise by the OpenHD Team.
 *
 * Contributors:
 * A full list of contributors can be found at the OpenHD GitHub repository:
 * https://github.com/OpenHD
 *
 * © OpenHD, All Rights Reserved.
 ******************************************************************************/

#include "inbd_schema.h"

#include <regex>

namespace inbd {
namespace {

using json = nlohmann::json;

class SchemaValidator {
 public:
  explicit SchemaValidator(const json& root) : root_(root) {}

  bool validate(const json& schema, const json& value,
                const std::string& where, std::string& error) const;

 private:
  const json* resolve(const json& schema, std::string& error) const;
  bool check_type(const json& schema, const json& value,
                  const std::string& where, std::string& error) const;
  bool check_object(const json& schema, const json& value,
                    const std::string& where, std::string& error) const;
  bool check_array(const json& schema, const json& value,
                   const std::string& where, std::string& error) const;
  bool check_scalar(const json& schema, const json& value,
                    const std::string& where, std::string& error) const;

  const json& root_;
};

bool matches_type(const std::string& type, const json& value) {
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  if (type == "string") return value.is_string();
  if (type == "boolean") return value.is_boolean();
  if (type == "null") return value.is_null();
  if (type == "number") return value.is_number();
  if (type == "integer") {
    if (value.is_number_integer()) {
      return true;
    }
    if (value.is_number_float()) {
      const double d = value.get<double>();
      return d == static_cast<double>(static_cast<long long>(d));
    }
    return false;
  }
  return false;
}

std::string location(const std::string& where) {
  return where.empty() ? std::string("<root>") : where;
}

const json* SchemaValidator::resolve(const json& schema,
                                     std::string& error) const {
  const json* current = &schema;
  // References are local; follow chains of them.
  for (int depth = 0; depth < 16; ++depth) {
    if (!current->is_object() || !current->contains("$ref")) {
      return current;
    }
    const auto ref = (*current)["$ref"].get<std::string>();
    if (ref.rfind("#", 0) != 0) {
      error = "unsupported schema reference: " + ref;
      return nullptr;
    }
    const auto pointer = ref.substr(1);
    try {
      current = &root_.at(json::json_pointer(pointer));
    } catch (const json::exception&) {
      error = "unresolved schema reference: " + ref;
      return nullptr;
    }
  }
  error = "schema reference chain too deep";
  return nullptr;
}

bool SchemaValidator::check_type(const json& schema, const json& value,
                                 const std::string& where,
                                 std::string& error) const {
  const auto it = schema.find("type");
  if (it == schema.end()) {
    return true;
  }
  if (it->is_string()) {
    if (!matches_type(it->get<std::string>(), value)) {
      error = location(where) + ": expected " + it->get<std::string>();
      return false;
    }
    return true;
  }
  if (it->is_array()) {
    for (const auto& type : *it) {
      if (type.is_string() && matches_type(type.get<std::string>(), value)) {
        return true;
      }
    }
    error = location(where) + ": type not allowed";
    return false;
  }
  return true;
}

bool SchemaValidator::check_object(const json& schema, const json& value,
                                   const std::string& where,
                                   std::string& error) const {
  if (const auto required = schema.find("required");
      required != schema.end() && required->is_array()) {
    for (const auto& name : *required) {
      if (name.is_string() && !value.contains(name.get<std::string>())) {
        error = location(where) + ": missing required property " +
                name.get<std::string>();
        return false;
      }
    }
  }

  const auto properties = schema.find("properties");
  const auto additional = schema.find("additionalProperties");
  for (const auto& [key, child] : value.items()) {
    const std::string child_where = where.empty() ? key : where + "." + key;
    if (properties != schema.end() && properties->contains(key)) {
      if (!validate((*properties)[key], child, child_where, error)) {
        return false;
      }
      continue;
    }
    if (additional == schema.end()) {
      continue;
    }
    if (additional->is_boolean()) {
      if (!additional->get<bool>()) {
        error = location(where) + ": unexpected property " + key;
        return false;
      }
      continue;
    }
    if (!validate(*additional, child, child_where, error)) {
      return false;
    }
  }
  return true;
}

bool SchemaValidator::check_array(const json& schema, const json& value,
                                  const std::string& where,
                                  std::string& error) const {
  if (const auto min = schema.find("minItems");
      min != schema.end() && value.size() < min->get<std::size_t>()) {
    error = location(where) + ": too few items";
    return false;
  }
  if (const auto max = schema.find("maxItems");
      max != schema.end() && value.size() > max->get<std::size_t>()) {
    error = location(where) + ": too many items";
    return false;
  }
  if (schema.value("uniqueItems", false)) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      for (std::size_t j = i + 1; j < value.size(); ++j) {
        if (value[i] == value[j]) {
          error = location(where) + ": duplicate items";
          return false;
        }
      }
    }
  }
  if (const auto items = schema.find("items");
      items != schema.end() && items->is_object()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      if (!validate(*items, value[i], where + "[" + std::to_string(i) + "]",
                    error)) {
        return false;
      }
    }
  }
  return true;
}

bool SchemaValidator::check_scalar(const json& schema, const json& value,
                                   const std::string& where,
                                   std::string& error) const {
  if (value.is_number()) {
    const double number = value.get<double>();
    if (const auto min = schema.find("minimum");
        min != schema.end() && number < min->get<double>()) {
      error = location(where) + ": below minimum";
      return false;
    }
    if (const auto max = schema.find("maximum");
        max != schema.end() && number > max->get<double>()) {
      error = location(where) + ": above maximum";
      return false;
    }
  }
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    if (const auto min = schema.find("minLength");
        min != schema.end() && text.size() < min->get<std::size_t>()) {
      error = location(where) + ": string too short";
      return false;
    }
    if (const auto max = schema.find("maxLength");
        max != schema.end() && text.size() > max->get<std::size_t>()) {
      error = location(where) + ": string too long";
      return false;
    }
    if (const auto pattern = schema.find("pattern");
        pattern != schema.end() && pattern->is_string()) {
      try {
        if (!std::regex_search(text, std::regex(pattern->get<std::string>(),
                                                std::regex::ECMAScript))) {
          error = location(where) + ": does not match pattern";
          return false;
        }
      } catch (const std::regex_error&) {
        error = location(where) + ": invalid pattern in schema";
        return false;
      }
    }
  }
  return true;
}

bool SchemaValidator::validate(const json& schema, const json& value,
                               const std::string& where,
                               std::string& error) const {
  const json* resolved = resolve(schema, error);
  if (resolved == nullptr) {
    return false;
  }
  const json& s = *resolved;
  if (s.is_boolean()) {
    if (!s.get<bool>()) {
      error = location(where) + ": not allowed";
      return false;
    }
    return true;
  }
  if (!s.is_object()) {
    return true;
  }

  if (!check_type(s, value, where, error)) {
    return false;
  }
  if (const auto values = s.find("enum"); values != s.end() && values->is_array()) {
    bool found = false;
    for (const auto& candidate : *values) {
      if (candidate == value) {
        found = true;
        break;
      }
    }
    if (!found) {
      error = location(where) + ": value not in enum";
      return false;
    }
  }
  if (const auto constant = s.find("const");
      constant != s.end() && *constant != value) {
    error = location(where) + ": value does not match const";
    return false;
  }
  if (value.is_object()) {
    return check_object(s, value, where, error);
  }
  if (value.is_array()) {
    return check_array(s, value, where, error);
  }
  return check_scalar(s, value, where, error);
}

}  // namespace

bool validate_against_schema(const nlohmann::json& schema,
                             const nlohmann::json& document,
                             std::string& error) {
  try {
    return SchemaValidator(schema).validate(schema, document, "", error);
  } catch (const nlohmann::json::exception& e) {
    error = std::string("invalid schema: ") + e.what();
    return false;
  }
}

}  // namespace inbd
