// schema_gen/schema/numeric_bounds.cpp - Overflow-aware numeric window
#include "schema_gen/schema/numeric_bounds.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

namespace schema_gen
{

namespace
{

constexpr const char * k_minimum = "minimum";
constexpr const char * k_maximum = "maximum";

[[noreturn]] void overflow(const Json & number, const char * bound)
{
  throw NumericRangeOverflow(number.dump(), bound);
}

NumericWindow signed_window(
  const Json & number, int64_t value, int64_t delta, OverflowPolicy policy)
{
  constexpr int64_t lowest = std::numeric_limits<int64_t>::min();
  constexpr int64_t highest = std::numeric_limits<int64_t>::max();

  NumericWindow window;

  if (value < lowest + delta) {
    if (policy == OverflowPolicy::Error) overflow(number, k_minimum);
    window.minimum = lowest;
  } else {
    window.minimum = value - delta;
  }

  if (value > highest - delta) {
    if (policy == OverflowPolicy::Error) overflow(number, k_maximum);
    window.maximum = highest;
  } else {
    window.maximum = value + delta;
  }

  return window;
}

// Only reached for values above INT64_MAX, so the minimum cannot underflow.
NumericWindow unsigned_window(
  const Json & number, uint64_t value, int64_t delta, OverflowPolicy policy)
{
  constexpr uint64_t highest = std::numeric_limits<uint64_t>::max();
  const auto udelta = static_cast<uint64_t>(delta);

  NumericWindow window;
  window.minimum = value - udelta;

  if (value > highest - udelta) {
    if (policy == OverflowPolicy::Error) overflow(number, k_maximum);
    window.maximum = highest;
  } else {
    window.maximum = value + udelta;
  }

  return window;
}

NumericWindow float_window(const Json & number, double value, int64_t delta, OverflowPolicy policy)
{
  const auto fdelta = static_cast<double>(delta);

  NumericWindow window;
  double minimum = value - fdelta;
  double maximum = value + fdelta;

  // Non-finite inputs propagate as-is; only finite -> infinite is an overflow
  if (std::isfinite(value)) {
    if (!std::isfinite(minimum)) {
      if (policy == OverflowPolicy::Error) overflow(number, k_minimum);
      minimum = std::numeric_limits<double>::lowest();
    }
    if (!std::isfinite(maximum)) {
      if (policy == OverflowPolicy::Error) overflow(number, k_maximum);
      maximum = std::numeric_limits<double>::max();
    }
  }

  window.minimum = minimum;
  window.maximum = maximum;
  return window;
}

}  // namespace

NumericRangeOverflow::NumericRangeOverflow(std::string value, std::string bound)
: std::overflow_error(bound + " of numeric window around " + value + " is out of range"),
  value_(std::move(value)),
  bound_(std::move(bound))
{
}

const char * to_string(OverflowPolicy policy) noexcept
{
  switch (policy) {
    case OverflowPolicy::Saturate:
      return "saturate";
    case OverflowPolicy::Error:
      return "error";
  }
  return "saturate";
}

std::optional<OverflowPolicy> parse_overflow_policy(std::string_view name)
{
  std::string lowered;
  lowered.reserve(name.size());
  for (const char c : name) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lowered == "saturate") return OverflowPolicy::Saturate;
  if (lowered == "error") return OverflowPolicy::Error;
  return std::nullopt;
}

NumericWindow numeric_window(const Json & number, int64_t delta, OverflowPolicy policy)
{
  switch (number.type()) {
    case Json::value_t::number_integer:
      return signed_window(number, number.get<int64_t>(), delta, policy);

    case Json::value_t::number_unsigned: {
      const auto value = number.get<uint64_t>();
      if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return signed_window(number, static_cast<int64_t>(value), delta, policy);
      }
      return unsigned_window(number, value, delta, policy);
    }

    case Json::value_t::number_float:
      return float_window(number, number.get<double>(), delta, policy);

    default:
      break;
  }
  throw std::invalid_argument(std::string("numeric window of non-number: ") + number.type_name());
}

}  // namespace schema_gen
