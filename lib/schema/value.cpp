// schema_gen/schema/value.cpp - Value kind classification
#include "schema_gen/schema/value.hpp"

namespace schema_gen
{

ValueKind kind_of(const Json & value)
{
  switch (value.type()) {
    case Json::value_t::object:
      return ValueKind::Object;
    case Json::value_t::array:
      return ValueKind::Array;
    case Json::value_t::string:
      return ValueKind::String;
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float:
      return ValueKind::Number;
    case Json::value_t::boolean:
      return ValueKind::Boolean;
    case Json::value_t::null:
      return ValueKind::Null;
    case Json::value_t::binary:
    case Json::value_t::discarded:
      break;
  }
  throw UnsupportedValueKind(value.type_name());
}

const char * to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Object:
      return "object";
    case ValueKind::Array:
      return "array";
    case ValueKind::String:
      return "string";
    case ValueKind::Number:
      return "number";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Null:
      return "null";
  }
  return "null";
}

}  // namespace schema_gen
