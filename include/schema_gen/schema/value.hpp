// schema_gen/schema/value.hpp - Input value model
//
// Input documents are nlohmann::ordered_json trees: objects keep their
// insertion order, which is what makes generated `properties` deterministic.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace schema_gen
{

/// JSON value tree used for both input documents and generated schemas.
using Json = nlohmann::ordered_json;

/**
 * Top-level kind of a JSON value.
 *
 * Integer and floating storage share the Number kind; the number
 * generator tells them apart.
 */
enum class ValueKind : uint8_t {
  Object,
  Array,
  String,
  Number,
  Boolean,
  Null,
};

/**
 * Thrown for nlohmann storage kinds outside the JSON value union
 * (`binary`, `discarded`). Parsing JSON text never produces them.
 */
class UnsupportedValueKind : public std::invalid_argument
{
public:
  explicit UnsupportedValueKind(const std::string & type_name)
  : std::invalid_argument("unsupported JSON value kind: " + type_name)
  {
  }
};

/**
 * Classify a value by its top-level kind.
 *
 * @throws UnsupportedValueKind for binary or discarded values
 */
[[nodiscard]] ValueKind kind_of(const Json & value);

/// Kind tag as used in schema documents ("object", "array", ..., "null")
[[nodiscard]] const char * to_string(ValueKind kind) noexcept;

}  // namespace schema_gen
