// tests/unit/validation/test_schema_checker.cpp - Vocabulary check of schema documents

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "schema_gen/schema/generator.hpp"
#include "schema_gen/validation/schema_checker.hpp"

using namespace schema_gen;

namespace
{

std::vector<std::string> pointers_of(const DiagnosticBag & diags)
{
  std::vector<std::string> pointers;
  for (const auto & d : diags) {
    pointers.push_back(d.json_pointer.value_or("<none>"));
  }
  return pointers;
}

}  // namespace

// ============================================================================
// Generated documents pass
// ============================================================================

TEST(SchemaCheckerTest, GeneratedSchemasPassAtEveryTier)
{
  const Json input = Json::parse(R"({
    "name": "John",
    "phone": "555-1234",
    "email": "john@example.com",
    "site": "http://example.com",
    "age": 30,
    "ratio": 0.25,
    "tags": ["a", "b"],
    "mixed": [1, "x", null, {"k": false}],
    "empty": [],
    "nothing": null,
    "nested": {"deep": {"deeper": [[1.5]]}}
  })");

  for (size_t i = 0; i < k_tier_count; ++i) {
    const Json schema = generate_schema(input, static_cast<Tier>(i));
    const DiagnosticBag diags = check_schema(schema);
    EXPECT_FALSE(diags.has_errors()) << k_tier_names[i] << ": " << schema.dump(2);
  }
}

TEST(SchemaCheckerTest, BooleanSchemasAreValid)
{
  EXPECT_TRUE(check_schema(Json(true)).empty());
  EXPECT_TRUE(check_schema(Json::parse(R"({"items": false})")).empty());
}

TEST(SchemaCheckerTest, UnknownKeywordsAreAccepted)
{
  EXPECT_TRUE(check_schema(Json::parse(R"({"x-vendor": 1, "type": "string"})")).empty());
}

// ============================================================================
// Violations
// ============================================================================

TEST(SchemaCheckerTest, RootMustBeObjectOrBoolean)
{
  const DiagnosticBag diags = check_schema(Json::parse("[1, 2]"));

  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all().front().code, diag_code::k_schema_violation);
  EXPECT_EQ(pointers_of(diags), (std::vector<std::string>{"/"}));
}

TEST(SchemaCheckerTest, UnknownTypeName)
{
  const DiagnosticBag diags = check_schema(Json::parse(R"({"type": "float"})"));

  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(pointers_of(diags), (std::vector<std::string>{"/type"}));
  EXPECT_NE(diags.all().front().message.find("float"), std::string::npos);
}

TEST(SchemaCheckerTest, TypeArrayMustBeUnique)
{
  EXPECT_TRUE(check_schema(Json::parse(R"({"type": ["string", "null"]})")).empty());

  const DiagnosticBag diags = check_schema(Json::parse(R"({"type": ["string", "string"]})"));
  EXPECT_EQ(pointers_of(diags), (std::vector<std::string>{"/type/1"}));
}

TEST(SchemaCheckerTest, NestedViolationsCarryPointers)
{
  const Json schema = Json::parse(R"({
    "type": "object",
    "properties": {
      "tags": {"type": "array", "items": {"type": "string", "minLength": -1}, "minItems": 1.5},
      "a/b": {"type": 3}
    }
  })");

  const DiagnosticBag diags = check_schema(schema);

  EXPECT_EQ(
    pointers_of(diags), (std::vector<std::string>{
                          "/properties/tags/items/minLength",
                          "/properties/tags/minItems",
                          "/properties/a~1b/type",
                        }));
}

TEST(SchemaCheckerTest, RequiredEntries)
{
  const DiagnosticBag diags = check_schema(Json::parse(R"({"required": ["a", 1, "a"]})"));

  EXPECT_EQ(pointers_of(diags), (std::vector<std::string>{"/required/1", "/required/2"}));
}

TEST(SchemaCheckerTest, OneOfMustBeNonEmptyArrayOfSchemas)
{
  EXPECT_EQ(
    pointers_of(check_schema(Json::parse(R"({"items": {"oneOf": []}})"))),
    (std::vector<std::string>{"/items/oneOf"}));
  EXPECT_EQ(
    pointers_of(check_schema(Json::parse(R"({"items": {"oneOf": [{"type": "null"}, 5]}})"))),
    (std::vector<std::string>{"/items/oneOf/1"}));
}

TEST(SchemaCheckerTest, ScalarKeywordKinds)
{
  const Json schema = Json::parse(R"({
    "title": 1,
    "uniqueItems": "yes",
    "examples": "x",
    "minimum": "0",
    "multipleOf": 0,
    "format": false
  })");

  const DiagnosticBag diags = check_schema(schema);

  EXPECT_EQ(diags.size(), 6U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.code, "E0301");
    EXPECT_EQ(d.severity, Severity::Error);
  }
}

TEST(SchemaCheckerTest, PatternMustCompile)
{
  EXPECT_TRUE(check_schema(Json::parse(R"({"pattern": "^[\\d\\-\\s]+$"})")).empty());

  const DiagnosticBag diags = check_schema(Json::parse(R"({"pattern": "([a-z"})"));
  EXPECT_EQ(pointers_of(diags), (std::vector<std::string>{"/pattern"}));
}

TEST(SchemaCheckerTest, CheckerReportsSuccess)
{
  DiagnosticBag diags;
  SchemaChecker checker(diags);

  EXPECT_TRUE(checker.check(Json::parse(R"({"type": "integer", "minimum": -958})")));
  EXPECT_FALSE(checker.check(Json::parse(R"({"maxItems": -1})")));
  EXPECT_EQ(diags.size(), 1U);
}

TEST(SchemaCheckerTest, PointerKeysAreEscaped)
{
  const Json schema = Json::parse(R"({
    "properties": {"a/b~c": {"properties": {"~": {"maxLength": -2}}}},
    "oneOf": [{"type": "string"}, {"minItems": -1}]
  })");

  const DiagnosticBag diags = check_schema(schema);

  EXPECT_EQ(
    pointers_of(diags), (std::vector<std::string>{
                          "/properties/a~1b~0c/properties/~0/maxLength",
                          "/oneOf/1/minItems",
                        }));
}
