// schema_gen/schema/generator.hpp - Tiered JSON Schema inference
//
// generate_schema() walks a JSON value and returns a schema document
// describing it. The walk is a single structural recursion: objects and
// arrays recurse into the dispatcher, scalars produce leaf schemas.
//
#pragma once

#include "schema_gen/schema/numeric_bounds.hpp"
#include "schema_gen/schema/tier.hpp"
#include "schema_gen/schema/value.hpp"

namespace schema_gen
{

// ============================================================================
// Generate Options
// ============================================================================

struct GenerateOptions
{
  /// Strictness / metadata tier
  Tier tier = Tier::Standard;

  /// Handling of unrepresentable minimum/maximum bounds
  OverflowPolicy overflow = OverflowPolicy::Saturate;
};

// ============================================================================
// Dispatcher
// ============================================================================

/**
 * Infer a schema document for a JSON value.
 *
 * The input is only read. Output keys of `properties` follow the input's
 * key order. Recursion depth equals the nesting depth of the input and is
 * not bounded; pathologically deep documents can exhaust the stack.
 *
 * @param value Parsed JSON value
 * @param tier Output tier
 * @return Schema document (a JSON object)
 * @throws UnsupportedValueKind for binary/discarded values
 */
[[nodiscard]] Json generate_schema(const Json & value, Tier tier);

/**
 * @throws NumericRangeOverflow if options.overflow is OverflowPolicy::Error
 *         and a numeric bound does not fit
 */
[[nodiscard]] Json generate_schema(const Json & value, const GenerateOptions & options);

// ============================================================================
// Per-kind Generators
// ============================================================================

/// `value` must be an object.
[[nodiscard]] Json generate_object_schema(const Json & value, const GenerateOptions & options);

/// `value` must be an array.
[[nodiscard]] Json generate_array_schema(const Json & value, const GenerateOptions & options);

/// `value` must be a string.
[[nodiscard]] Json generate_string_schema(const Json & value, const GenerateOptions & options);

/// `value` must be a number.
[[nodiscard]] Json generate_number_schema(const Json & value, const GenerateOptions & options);

/// `value` must be a boolean.
[[nodiscard]] Json generate_boolean_schema(const Json & value, const GenerateOptions & options);

[[nodiscard]] Json generate_null_schema();

}  // namespace schema_gen
