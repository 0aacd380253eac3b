// schema_gen/schema/heuristics.hpp - Pure predicates used by the generators
#pragma once

#include <optional>
#include <set>
#include <string_view>

#include "schema_gen/schema/value.hpp"

namespace schema_gen
{

/// Distinct top-level kinds among the elements of an array value.
[[nodiscard]] std::set<ValueKind> array_item_kinds(const Json & array);

/**
 * True if all elements share one top-level kind (vacuously true when empty).
 *
 * Only kind tags are compared: two objects with different keys still count
 * as homogeneous.
 */
[[nodiscard]] bool is_homogeneous_array(const Json & array);

/**
 * Sniff a `format` for a string value.
 *
 * "email" if the text contains both '@' and '.', otherwise "uri" if it
 * starts with "http", otherwise nothing.
 */
[[nodiscard]] std::optional<std::string_view> detect_string_format(std::string_view text);

/**
 * Sniff a `pattern` for a string value: digit/dash/space strings such as
 * phone numbers map to `^[\d\-\s]+$`. Vacuously matches the empty string.
 */
[[nodiscard]] std::optional<std::string_view> detect_string_pattern(std::string_view text);

inline constexpr std::string_view k_digits_pattern = R"(^[\d\-\s]+$)";

}  // namespace schema_gen
