// schema_gen/schema/heuristics.cpp - Homogeneity and string sniffing
#include "schema_gen/schema/heuristics.hpp"

#include <algorithm>

namespace schema_gen
{

std::set<ValueKind> array_item_kinds(const Json & array)
{
  std::set<ValueKind> kinds;
  for (const auto & item : array) {
    kinds.insert(kind_of(item));
  }
  return kinds;
}

bool is_homogeneous_array(const Json & array) { return array_item_kinds(array).size() <= 1; }

std::optional<std::string_view> detect_string_format(std::string_view text)
{
  if (text.find('@') != std::string_view::npos && text.find('.') != std::string_view::npos) {
    return std::string_view("email");
  }
  if (text.substr(0, 4) == "http") {
    return std::string_view("uri");
  }
  return std::nullopt;
}

std::optional<std::string_view> detect_string_pattern(std::string_view text)
{
  const bool digits_only = std::all_of(text.begin(), text.end(), [](char c) {
    return (c >= '0' && c <= '9') || c == '-' || c == ' ';
  });
  if (digits_only) {
    return k_digits_pattern;
  }
  return std::nullopt;
}

}  // namespace schema_gen
