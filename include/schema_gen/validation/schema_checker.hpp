// schema_gen/validation/schema_checker.hpp - Vocabulary check of generated schemas
//
// Verifies that a schema document is well-formed with respect to the
// JSON Schema 2020-12 meta-schema rules for the keywords this tool emits.
// It checks the schema itself, not instances against the schema.
//
#pragma once

#include "schema_gen/basic/diagnostic.hpp"
#include "schema_gen/schema/value.hpp"

namespace schema_gen
{

/// RFC 6901 pointer into a schema document; keys are escaped on append
using JsonPointer = Json::json_pointer;

/**
 * Recursive checker for schema documents.
 *
 * Each violation becomes an error diagnostic (code E0301) carrying the
 * JSON pointer of the offending subschema. Keywords it does not know are
 * accepted, as the meta-schema does.
 */
class SchemaChecker
{
public:
  explicit SchemaChecker(DiagnosticBag & diags) : diags_(diags) {}

  /**
   * Check a schema document.
   *
   * @param schema Root schema
   * @return true if no violation was found
   */
  bool check(const Json & schema);

private:
  void check_schema(const Json & schema, const JsonPointer & pointer);

  void check_type(const Json & type, const JsonPointer & pointer);
  void check_properties(const Json & properties, const JsonPointer & pointer);
  void check_required(const Json & required, const JsonPointer & pointer);
  void check_one_of(const Json & one_of, const JsonPointer & pointer);
  void check_pattern(const Json & pattern, const JsonPointer & pointer);

  void check_non_negative_integer(
    const Json & schema, const char * keyword, const JsonPointer & pointer);
  void check_kind(
    const Json & schema, const char * keyword, Json::value_t expected, const JsonPointer & pointer);
  void check_number(const Json & schema, const char * keyword, const JsonPointer & pointer);

  void report(const JsonPointer & pointer, std::string message);

  DiagnosticBag & diags_;
  size_t errors_ = 0;
};

/**
 * Check a schema document and collect the violations.
 */
[[nodiscard]] DiagnosticBag check_schema(const Json & schema);

}  // namespace schema_gen
