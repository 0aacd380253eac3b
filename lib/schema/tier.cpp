// schema_gen/schema/tier.cpp - Tier names and policy table
#include "schema_gen/schema/tier.hpp"

#include <cctype>
#include <string>

namespace schema_gen
{

const char * to_string(Tier tier) noexcept
{
  return k_tier_names[static_cast<size_t>(tier)];
}

std::optional<Tier> parse_tier(std::string_view name)
{
  std::string lowered;
  lowered.reserve(name.size());
  for (const char c : name) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  for (size_t i = 0; i < k_tier_names.size(); ++i) {
    if (lowered == k_tier_names[i]) {
      return static_cast<Tier>(i);
    }
  }
  return std::nullopt;
}

const TierPolicy & policy_for(Tier tier) noexcept
{
  return k_tier_policies[static_cast<size_t>(tier)];
}

}  // namespace schema_gen
