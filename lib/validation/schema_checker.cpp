// schema_gen/validation/schema_checker.cpp - Vocabulary check of generated schemas
#include "schema_gen/validation/schema_checker.hpp"

#include <array>
#include <cmath>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace schema_gen
{

namespace
{

constexpr std::array<std::string_view, 7> k_simple_types = {
  "array", "boolean", "integer", "null", "number", "object", "string"};

bool is_simple_type(const Json & name)
{
  if (!name.is_string()) return false;
  const auto & text = name.get_ref<const std::string &>();
  for (const auto candidate : k_simple_types) {
    if (candidate == text) return true;
  }
  return false;
}

}  // namespace

// ============================================================================
// SchemaChecker
// ============================================================================

bool SchemaChecker::check(const Json & schema)
{
  errors_ = 0;
  check_schema(schema, JsonPointer());
  return errors_ == 0;
}

void SchemaChecker::check_schema(const Json & schema, const JsonPointer & pointer)
{
  if (schema.is_boolean()) {
    return;
  }
  if (!schema.is_object()) {
    report(
      pointer, std::string("schema must be an object or boolean, found ") + schema.type_name());
    return;
  }

  if (auto it = schema.find("type"); it != schema.end()) {
    check_type(*it, pointer);
  }
  if (auto it = schema.find("properties"); it != schema.end()) {
    check_properties(*it, pointer);
  }
  if (auto it = schema.find("required"); it != schema.end()) {
    check_required(*it, pointer);
  }
  if (auto it = schema.find("additionalProperties"); it != schema.end()) {
    check_schema(*it, pointer / "additionalProperties");
  }
  if (auto it = schema.find("items"); it != schema.end()) {
    check_schema(*it, pointer / "items");
  }
  if (auto it = schema.find("oneOf"); it != schema.end()) {
    check_one_of(*it, pointer);
  }
  if (auto it = schema.find("pattern"); it != schema.end()) {
    check_pattern(*it, pointer);
  }

  for (const char * keyword :
       {"minProperties", "minItems", "maxItems", "minLength", "maxLength"}) {
    check_non_negative_integer(schema, keyword, pointer);
  }
  for (const char * keyword : {"$schema", "title", "description", "format"}) {
    check_kind(schema, keyword, Json::value_t::string, pointer);
  }
  check_kind(schema, "uniqueItems", Json::value_t::boolean, pointer);
  check_kind(schema, "examples", Json::value_t::array, pointer);
  check_number(schema, "minimum", pointer);
  check_number(schema, "maximum", pointer);

  if (auto it = schema.find("multipleOf"); it != schema.end()) {
    if (!it->is_number() || !(it->get<double>() > 0.0)) {
      report(pointer / "multipleOf", "'multipleOf' must be a number strictly greater than 0");
    }
  }
}

void SchemaChecker::check_type(const Json & type, const JsonPointer & pointer)
{
  const JsonPointer here = pointer / "type";

  if (type.is_string()) {
    if (!is_simple_type(type)) {
      report(here, "unknown type name '" + type.get<std::string>() + "'");
    }
    return;
  }

  if (type.is_array()) {
    if (type.empty()) {
      report(here, "'type' array must not be empty");
      return;
    }
    std::set<std::string> seen;
    for (size_t i = 0; i < type.size(); ++i) {
      if (!is_simple_type(type[i])) {
        report(here / i, "'type' entries must be simple type names");
        continue;
      }
      if (!seen.insert(type[i].get<std::string>()).second) {
        report(here / i, "'type' entries must be unique");
      }
    }
    return;
  }

  report(here, "'type' must be a string or an array of strings");
}

void SchemaChecker::check_properties(const Json & properties, const JsonPointer & pointer)
{
  const JsonPointer here = pointer / "properties";
  if (!properties.is_object()) {
    report(here, "'properties' must be an object");
    return;
  }
  for (auto it = properties.begin(); it != properties.end(); ++it) {
    check_schema(it.value(), here / it.key());
  }
}

void SchemaChecker::check_required(const Json & required, const JsonPointer & pointer)
{
  const JsonPointer here = pointer / "required";
  if (!required.is_array()) {
    report(here, "'required' must be an array of strings");
    return;
  }
  std::set<std::string> seen;
  for (size_t i = 0; i < required.size(); ++i) {
    if (!required[i].is_string()) {
      report(here / i, "'required' entries must be strings");
      continue;
    }
    if (!seen.insert(required[i].get<std::string>()).second) {
      report(here / i, "'required' entries must be unique");
    }
  }
}

void SchemaChecker::check_one_of(const Json & one_of, const JsonPointer & pointer)
{
  const JsonPointer here = pointer / "oneOf";
  if (!one_of.is_array() || one_of.empty()) {
    report(here, "'oneOf' must be a non-empty array of schemas");
    return;
  }
  for (size_t i = 0; i < one_of.size(); ++i) {
    check_schema(one_of[i], here / i);
  }
}

void SchemaChecker::check_pattern(const Json & pattern, const JsonPointer & pointer)
{
  const JsonPointer here = pointer / "pattern";
  if (!pattern.is_string()) {
    report(here, "'pattern' must be a string");
    return;
  }
  try {
    const std::regex compiled(pattern.get<std::string>(), std::regex::ECMAScript);
    (void)compiled;
  } catch (const std::regex_error & e) {
    report(here, std::string("'pattern' is not a valid regular expression: ") + e.what());
  }
}

void SchemaChecker::check_non_negative_integer(
  const Json & schema, const char * keyword, const JsonPointer & pointer)
{
  auto it = schema.find(keyword);
  if (it == schema.end()) return;

  bool valid = false;
  if (it->is_number_unsigned()) {
    valid = true;
  } else if (it->is_number_integer()) {
    valid = it->get<int64_t>() >= 0;
  } else if (it->is_number_float()) {
    // 2020-12 accepts integral floats such as 2.0
    const double value = it->get<double>();
    valid = value >= 0.0 && std::isfinite(value) && std::floor(value) == value;
  }

  if (!valid) {
    report(
      pointer / keyword, std::string("'") + keyword + "' must be a non-negative integer");
  }
}

void SchemaChecker::check_kind(
  const Json & schema, const char * keyword, Json::value_t expected, const JsonPointer & pointer)
{
  auto it = schema.find(keyword);
  if (it == schema.end() || it->type() == expected) return;

  const char * expectation = expected == Json::value_t::string    ? "a string"
                             : expected == Json::value_t::boolean ? "a boolean"
                                                                  : "an array";
  report(pointer / keyword, std::string("'") + keyword + "' must be " + expectation);
}

void SchemaChecker::check_number(
  const Json & schema, const char * keyword, const JsonPointer & pointer)
{
  auto it = schema.find(keyword);
  if (it == schema.end() || it->is_number()) return;

  report(pointer / keyword, std::string("'") + keyword + "' must be a number");
}

void SchemaChecker::report(const JsonPointer & pointer, std::string message)
{
  ++errors_;
  diags_.report_error(std::move(message))
    .with_code(diag_code::k_schema_violation)
    .with_pointer(pointer.empty() ? std::string("/") : pointer.to_string())
    .with_help("generated schemas must satisfy the JSON Schema 2020-12 meta-schema");
}

// ============================================================================
// Convenience
// ============================================================================

DiagnosticBag check_schema(const Json & schema)
{
  DiagnosticBag diags;
  SchemaChecker checker(diags);
  checker.check(schema);
  return diags;
}

}  // namespace schema_gen
