// schema_gen/schema/scalar_generators.cpp - string, number, boolean and null schemas
#include <string>
#include <utility>

#include "schema_gen/schema/generator.hpp"
#include "schema_gen/schema/heuristics.hpp"

namespace schema_gen
{

Json generate_string_schema(const Json & value, const GenerateOptions & options)
{
  const TierPolicy & policy = policy_for(options.tier);
  const auto & text = value.get_ref<const std::string &>();

  Json schema = Json::object();
  schema["type"] = "string";
  if (policy.titles) {
    schema["title"] = "Generated String Schema";
  }
  if (policy.min_length) {
    schema["minLength"] = 0;
  }
  if (policy.max_length) {
    // Byte length, not code points
    schema["maxLength"] = k_length_factor * static_cast<uint64_t>(text.size());
  }

  if (text.empty()) {
    return schema;
  }

  if (policy.examples) {
    schema["examples"] = Json::array({text});
  }

  // format and pattern are mutually exclusive; format wins
  if (policy.detect_format) {
    if (const auto format = detect_string_format(text)) {
      schema["format"] = std::string(*format);
    } else if (const auto pattern = detect_string_pattern(text)) {
      schema["pattern"] = std::string(*pattern);
    }
  }

  return schema;
}

Json generate_number_schema(const Json & value, const GenerateOptions & options)
{
  const TierPolicy & policy = policy_for(options.tier);

  // Integer storage (signed or unsigned) round-trips exactly; floats do not
  const bool integral = value.is_number_integer();

  Json schema = Json::object();
  schema["type"] = integral ? "integer" : "number";
  if (policy.titles) {
    schema["title"] = integral ? "Generated Integer Schema" : "Generated Number Schema";
  }

  if (policy.literal_minimum) {
    schema["minimum"] = value;
  }
  if (policy.numeric_window) {
    NumericWindow window = numeric_window(value, k_numeric_window, options.overflow);
    schema["minimum"] = std::move(window.minimum);
    schema["maximum"] = std::move(window.maximum);
  }
  if (policy.integer_multiple_of && integral) {
    schema["multipleOf"] = 1;
  }
  if (policy.examples) {
    schema["examples"] = Json::array({value});
  }

  return schema;
}

Json generate_boolean_schema(const Json & value, const GenerateOptions & options)
{
  const TierPolicy & policy = policy_for(options.tier);

  Json schema = Json::object();
  schema["type"] = "boolean";
  if (policy.titles) {
    schema["title"] = "Generated Boolean Schema";
  }
  if (policy.descriptions) {
    schema["description"] = "Boolean value from JSON data";
  }
  if (policy.examples) {
    schema["examples"] = Json::array({value.get<bool>()});
  }

  return schema;
}

Json generate_null_schema()
{
  Json schema = Json::object();
  schema["type"] = "null";
  return schema;
}

}  // namespace schema_gen
