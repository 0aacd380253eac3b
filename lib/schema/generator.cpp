// schema_gen/schema/generator.cpp - Dispatcher and composite generators
#include "schema_gen/schema/generator.hpp"

#include <utility>

#include "schema_gen/schema/heuristics.hpp"

namespace schema_gen
{

namespace
{

bool is_required(RequiredRule rule, const Json & property_value)
{
  switch (rule) {
    case RequiredRule::None:
      return false;
    case RequiredRule::NonNullValues:
      return !property_value.is_null();
    case RequiredRule::AllKeys:
      return true;
  }
  return false;
}

}  // namespace

// ============================================================================
// Dispatcher
// ============================================================================

Json generate_schema(const Json & value, Tier tier)
{
  GenerateOptions options;
  options.tier = tier;
  return generate_schema(value, options);
}

Json generate_schema(const Json & value, const GenerateOptions & options)
{
  switch (kind_of(value)) {
    case ValueKind::Object:
      return generate_object_schema(value, options);
    case ValueKind::Array:
      return generate_array_schema(value, options);
    case ValueKind::String:
      return generate_string_schema(value, options);
    case ValueKind::Number:
      return generate_number_schema(value, options);
    case ValueKind::Boolean:
      return generate_boolean_schema(value, options);
    case ValueKind::Null:
      return generate_null_schema();
  }
  return generate_null_schema();
}

// ============================================================================
// Object
// ============================================================================

Json generate_object_schema(const Json & value, const GenerateOptions & options)
{
  const TierPolicy & policy = policy_for(options.tier);

  Json schema = Json::object();
  if (policy.schema_uri) {
    schema["$schema"] = k_schema_draft_uri;
  }
  schema["type"] = "object";
  if (policy.titles) {
    schema["title"] = "Generated Object Schema";
  }
  if (policy.descriptions) {
    schema["description"] = "Auto-generated schema from JSON data";
  }

  Json properties = Json::object();
  Json required = Json::array();
  for (auto it = value.begin(); it != value.end(); ++it) {
    properties[it.key()] = generate_schema(it.value(), options);
    if (is_required(policy.required, it.value())) {
      required.push_back(it.key());
    }
  }
  schema["properties"] = std::move(properties);

  if (!required.empty()) {
    schema["required"] = std::move(required);
  }
  if (policy.additional_properties) {
    schema["additionalProperties"] = *policy.additional_properties;
  }
  if (policy.min_properties) {
    schema["minProperties"] = *policy.min_properties;
  }

  return schema;
}

// ============================================================================
// Array
// ============================================================================

Json generate_array_schema(const Json & value, const GenerateOptions & options)
{
  Json schema = Json::object();
  schema["type"] = "array";

  if (value.empty()) {
    schema["items"] = Json::object();
    return schema;
  }

  const TierPolicy & policy = policy_for(options.tier);

  if (policy.titles) {
    schema["title"] = "Generated Array Schema";
  }
  if (policy.descriptions) {
    schema["description"] = "Auto-generated array schema from JSON data";
  }

  if (is_homogeneous_array(value)) {
    // The first element stands in for all of its siblings
    schema["items"] = generate_schema(value.front(), options);
  } else {
    Json variants = Json::array();
    for (const auto & item : value) {
      variants.push_back(generate_schema(item, options));
    }
    Json items = Json::object();
    items["oneOf"] = std::move(variants);
    schema["items"] = std::move(items);
  }

  if (policy.min_items) {
    schema["minItems"] = *policy.min_items;
  }
  if (policy.max_items) {
    schema["maxItems"] = k_length_factor * static_cast<uint64_t>(value.size());
  }
  if (policy.unique_items) {
    schema["uniqueItems"] = true;
  }

  return schema;
}

}  // namespace schema_gen
