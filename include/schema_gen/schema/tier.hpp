// schema_gen/schema/tier.hpp - Output tiers and their policy table
//
// Every generator reads its tier-specific behavior from a TierPolicy;
// strictness rules live in one table instead of per-generator branching.
//
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace schema_gen
{

// ============================================================================
// Tier
// ============================================================================

/**
 * Output tier, ordered by increasing strictness and metadata density.
 */
enum class Tier : uint8_t {
  Basic,
  Standard,
  Comprehensive,
  Expert,
};

inline constexpr size_t k_tier_count = 4;

/// Names accepted on the command line and in configuration files
inline constexpr std::array<const char *, k_tier_count> k_tier_names = {
  "basic", "standard", "comprehensive", "expert"};

[[nodiscard]] const char * to_string(Tier tier) noexcept;

/// Case-insensitive lookup of a tier by name
[[nodiscard]] std::optional<Tier> parse_tier(std::string_view name);

// ============================================================================
// TierPolicy
// ============================================================================

/// Which object keys end up in `required`.
enum class RequiredRule : uint8_t {
  None,           ///< never emit `required`
  NonNullValues,  ///< keys whose value is not null
  AllKeys,        ///< every key
};

struct TierPolicy
{
  // --- object ---
  RequiredRule required = RequiredRule::None;
  std::optional<bool> additional_properties;
  /// Applied even to empty objects
  std::optional<uint64_t> min_properties;
  /// Emit the draft 2020-12 `$schema` URI on object schemas
  bool schema_uri = false;

  // --- array (non-empty only) ---
  std::optional<uint64_t> min_items;
  /// maxItems = k_length_factor * element count
  bool max_items = false;
  /// uniqueItems = true, regardless of the actual elements
  bool unique_items = false;

  // --- string ---
  bool min_length = false;
  /// maxLength = k_length_factor * byte length
  bool max_length = false;
  /// email / uri / digit-pattern sniffing
  bool detect_format = false;

  // --- number ---
  /// minimum = the literal value
  bool literal_minimum = false;
  /// minimum/maximum = value -/+ k_numeric_window
  bool numeric_window = false;
  /// multipleOf = 1 on integers
  bool integer_multiple_of = false;

  // --- shared ---
  /// `examples` on strings, numbers and booleans
  bool examples = false;
  bool titles = false;
  /// `description` on objects, arrays and booleans
  bool descriptions = false;
};

inline constexpr uint64_t k_length_factor = 2;
inline constexpr int64_t k_numeric_window = 1000;

inline constexpr const char * k_schema_draft_uri = "https://json-schema.org/draft/2020-12/schema";

/// Policy table, built at compile time (optionals are assigned whole to stay constexpr in C++17)
constexpr std::array<TierPolicy, k_tier_count> build_tier_policies()
{
  TierPolicy basic;

  TierPolicy standard;
  standard.required = RequiredRule::NonNullValues;
  standard.additional_properties = std::optional<bool>(true);
  standard.min_items = std::optional<uint64_t>(0);
  standard.min_length = true;
  standard.literal_minimum = true;

  TierPolicy comprehensive;
  comprehensive.required = RequiredRule::AllKeys;
  comprehensive.additional_properties = std::optional<bool>(false);
  comprehensive.min_properties = std::optional<uint64_t>(1);
  comprehensive.schema_uri = true;
  comprehensive.min_items = std::optional<uint64_t>(1);
  comprehensive.max_items = true;
  comprehensive.min_length = true;
  comprehensive.max_length = true;
  comprehensive.numeric_window = true;
  comprehensive.examples = true;

  TierPolicy expert = comprehensive;
  expert.unique_items = true;
  expert.detect_format = true;
  expert.integer_multiple_of = true;
  expert.titles = true;
  expert.descriptions = true;

  return {basic, standard, comprehensive, expert};
}

/// Indexed by Tier
inline constexpr std::array<TierPolicy, k_tier_count> k_tier_policies = build_tier_policies();

/**
 * Policy for a tier. The table is immutable and shared by all callers.
 */
[[nodiscard]] const TierPolicy & policy_for(Tier tier) noexcept;

}  // namespace schema_gen
