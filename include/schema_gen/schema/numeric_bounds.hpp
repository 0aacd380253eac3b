// schema_gen/schema/numeric_bounds.hpp - minimum/maximum window around a number
//
// The window is computed in the value's own arithmetic: signed 64-bit for
// integers that fit, unsigned 64-bit above INT64_MAX, double for floats.
// Near the limits of those types the result cannot be represented; the
// OverflowPolicy decides between clamping and failing. It never wraps.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "schema_gen/schema/value.hpp"

namespace schema_gen
{

enum class OverflowPolicy : uint8_t {
  Saturate,  ///< clamp to the limits of the value's type
  Error,     ///< throw NumericRangeOverflow
};

[[nodiscard]] const char * to_string(OverflowPolicy policy) noexcept;

/// "saturate" or "error" (case-insensitive)
[[nodiscard]] std::optional<OverflowPolicy> parse_overflow_policy(std::string_view name);

/**
 * A bound of the numeric window does not fit the value's type.
 */
class NumericRangeOverflow : public std::overflow_error
{
public:
  NumericRangeOverflow(std::string value, std::string bound);

  /// The input number, as JSON text
  [[nodiscard]] const std::string & value() const noexcept { return value_; }

  /// "minimum" or "maximum"
  [[nodiscard]] const std::string & bound() const noexcept { return bound_; }

private:
  std::string value_;
  std::string bound_;
};

struct NumericWindow
{
  Json minimum;
  Json maximum;
};

/**
 * Compute `value - delta` and `value + delta`.
 *
 * @param number A number value (integer, unsigned or float storage)
 * @param delta Half-width of the window
 * @param policy What to do when a bound is not representable
 * @throws NumericRangeOverflow with OverflowPolicy::Error
 */
[[nodiscard]] NumericWindow numeric_window(
  const Json & number, int64_t delta, OverflowPolicy policy);

}  // namespace schema_gen
