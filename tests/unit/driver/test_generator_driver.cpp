// tests/unit/driver/test_generator_driver.cpp - File pipeline and batch expansion

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "schema_gen/driver/generator_driver.hpp"
#include "schema_gen/test_support/fs_helpers.hpp"

using namespace schema_gen;
using schema_gen::test_support::read_all;
using schema_gen::test_support::ScopedTempDir;
using schema_gen::test_support::write_all;

namespace fs = std::filesystem;

namespace
{

const Diagnostic * first_error(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    if (d.severity == Severity::Error) {
      return &d;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(DriverHelpersTest, DefaultOutputPath)
{
  EXPECT_EQ(default_output_path("data/user.json"), fs::path("data/user.schema.json"));
  EXPECT_EQ(default_output_path("user.json"), fs::path("user.schema.json"));
  EXPECT_EQ(
    default_output_path("data/user.json", fs::path("out")), fs::path("out/user.schema.json"));
}

TEST(DriverHelpersTest, SerializeSchema)
{
  const Json schema = Json::parse(R"({"type": "object", "properties": {}})");

  EXPECT_EQ(serialize_schema(schema, false), R"({"type":"object","properties":{}})");
  EXPECT_EQ(serialize_schema(schema, true), "{\n  \"type\": \"object\",\n  \"properties\": {}\n}");
}

TEST(DriverHelpersTest, ExpandBatchSortsAndFilters)
{
  const ScopedTempDir dir("schema_gen_drv_glob");
  ASSERT_TRUE(write_all(dir / "b.json", "{}"));
  ASSERT_TRUE(write_all(dir / "a.JSON", "{}"));
  ASSERT_TRUE(write_all(dir / "c.txt", "{}"));
  fs::create_directories(dir / "d.json");

  DiagnosticBag diags;
  const auto files = expand_batch((dir.path() / "*").string(), {"json"}, diags);

  ASSERT_TRUE(files.has_value());
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(*files, (std::vector<fs::path>{dir / "a.JSON", dir / "b.json"}));

  const auto any = expand_batch((dir.path() / "*").string(), {}, diags);
  ASSERT_TRUE(any.has_value());
  EXPECT_EQ(any->size(), 3U);

  const auto dotted = expand_batch((dir.path() / "*").string(), {".txt"}, diags);
  ASSERT_TRUE(dotted.has_value());
  EXPECT_EQ(*dotted, (std::vector<fs::path>{dir / "c.txt"}));
}

TEST(DriverHelpersTest, ExpandBatchWithoutMatches)
{
  const ScopedTempDir dir("schema_gen_drv_nomatch");

  DiagnosticBag diags;
  const auto files = expand_batch((dir.path() / "*.json").string(), {"json"}, diags);

  ASSERT_TRUE(files.has_value());
  EXPECT_TRUE(files->empty());
  EXPECT_TRUE(diags.empty());
}

// ============================================================================
// Single file
// ============================================================================

TEST(GeneratorDriverTest, WritesSchemaBesideInput)
{
  const ScopedTempDir dir("schema_gen_drv_single");
  const fs::path input = dir / "user.json";
  ASSERT_TRUE(write_all(input, R"({"name":"John","age":30,"is_active":true})"));

  DriverOptions options;
  options.tier = Tier::Basic;

  const FileResult result = GeneratorDriver::process_single_file(input, options);

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_FALSE(result.validated);
  EXPECT_EQ(result.output, dir / "user.schema.json");

  const Json expected = generate_schema(Json::parse(read_all(input)), Tier::Basic);
  EXPECT_EQ(read_all(result.output), serialize_schema(expected, false));
}

TEST(GeneratorDriverTest, ExplicitOutputAndPretty)
{
  const ScopedTempDir dir("schema_gen_drv_explicit");
  const fs::path input = dir / "in.json";
  ASSERT_TRUE(write_all(input, "[1, 2, 3]"));

  DriverOptions options;
  options.pretty = true;
  options.output = dir / "nested" / "out.json";

  const FileResult result = GeneratorDriver::process_single_file(input, options);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, dir / "nested" / "out.json");
  const std::string written = read_all(result.output);
  EXPECT_EQ(Json::parse(written), generate_schema(Json::parse("[1, 2, 3]"), Tier::Standard));
  EXPECT_NE(written.find("\n  \"type\""), std::string::npos);
}

TEST(GeneratorDriverTest, OutputDirectoryIsCreated)
{
  const ScopedTempDir dir("schema_gen_drv_outdir");
  const fs::path input = dir / "doc.json";
  ASSERT_TRUE(write_all(input, R"({"ok": true})"));

  DriverOptions options;
  options.output_dir = dir / "schemas" / "v1";

  const FileResult result = GeneratorDriver::process_single_file(input, options);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, dir / "schemas" / "v1" / "doc.schema.json");
  EXPECT_TRUE(fs::is_regular_file(result.output));
}

TEST(GeneratorDriverTest, MissingInput)
{
  const ScopedTempDir dir("schema_gen_drv_missing");

  const FileResult result = GeneratorDriver::process_single_file(dir / "nope.json", {});

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.source == nullptr);
  const Diagnostic * error = first_error(result.diagnostics);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, diag_code::k_file_not_found);
  EXPECT_NE(error->message.find("file not found"), std::string::npos);
}

TEST(GeneratorDriverTest, InvalidJsonIsLabelled)
{
  const ScopedTempDir dir("schema_gen_drv_invalid");
  const fs::path input = dir / "broken.json";
  ASSERT_TRUE(write_all(input, "{\"a\": }"));

  const FileResult result = GeneratorDriver::process_single_file(input, {});

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.source != nullptr);
  const Diagnostic * error = first_error(result.diagnostics);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, diag_code::k_invalid_json);
  EXPECT_EQ(error->message.rfind("invalid JSON: ", 0), 0U) << error->message;
  EXPECT_EQ(error->message.find("[json.exception"), std::string::npos);
  ASSERT_EQ(error->labels.size(), 1U);
  EXPECT_TRUE(error->labels.front().range.is_valid());
  EXPECT_FALSE(fs::exists(dir / "broken.schema.json"));
}

TEST(GeneratorDriverTest, OverflowErrorPolicy)
{
  const ScopedTempDir dir("schema_gen_drv_overflow");
  const fs::path input = dir / "big.json";
  ASSERT_TRUE(write_all(input, R"({"n": -9223372036854775808})"));

  DriverOptions options;
  options.tier = Tier::Comprehensive;
  options.overflow = OverflowPolicy::Error;

  const FileResult failed = GeneratorDriver::process_single_file(input, options);
  EXPECT_FALSE(failed.success);
  const Diagnostic * error = first_error(failed.diagnostics);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, diag_code::k_numeric_overflow);
  EXPECT_TRUE(error->help_message.has_value());

  options.overflow = OverflowPolicy::Saturate;
  const FileResult saturated = GeneratorDriver::process_single_file(input, options);
  EXPECT_TRUE(saturated.success);
}

TEST(GeneratorDriverTest, ValidationPasses)
{
  const ScopedTempDir dir("schema_gen_drv_validate");
  const fs::path input = dir / "contact.json";
  ASSERT_TRUE(write_all(input, R"({"email": "a@b.io", "phone": "555-1234", "tags": []})"));

  DriverOptions options;
  options.tier = Tier::Expert;
  options.validate = true;

  const FileResult result = GeneratorDriver::process_single_file(input, options);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.validated);
  EXPECT_FALSE(result.diagnostics.has_errors());
}

TEST(GeneratorDriverTest, InvalidSchemaIsNotWritten)
{
  const ScopedTempDir dir("schema_gen_drv_reject");

  FileResult result;
  result.input = dir / "bad.json";
  DriverOptions options;
  options.validate = true;

  const Json schema = Json::parse(R"({"type": "float", "minLength": -1})");
  EXPECT_FALSE(GeneratorDriver::emit_schema(schema, options, result));

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.validated);
  EXPECT_FALSE(fs::exists(dir / "bad.schema.json"));

  const Diagnostic * error = first_error(result.diagnostics);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, diag_code::k_schema_violation);
  EXPECT_EQ(error->message, "schema validation failed");
  ASSERT_GE(result.diagnostics.errors().size(), 3U);
  for (const auto & d : result.diagnostics.errors()) {
    EXPECT_EQ(d.code, diag_code::k_schema_violation);
  }
}

TEST(GeneratorDriverTest, EmitSchemaWithoutCheckWrites)
{
  const ScopedTempDir dir("schema_gen_drv_emit");

  FileResult result;
  result.input = dir / "raw.json";

  const Json schema = Json::parse(R"({"type": "float"})");
  ASSERT_TRUE(GeneratorDriver::emit_schema(schema, {}, result));

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, dir / "raw.schema.json");
  EXPECT_EQ(read_all(result.output), R"({"type":"float"})");
}

TEST(GeneratorDriverTest, VerboseProgress)
{
  const ScopedTempDir dir("schema_gen_drv_verbose");
  const fs::path input = dir / "v.json";
  ASSERT_TRUE(write_all(input, "true"));

  std::ostringstream log;
  DriverOptions options;
  options.validate = true;
  options.verbose = true;
  options.log = &log;

  ASSERT_TRUE(GeneratorDriver::process_single_file(input, options).success);

  const std::string text = log.str();
  EXPECT_NE(text.find("Processing input file: "), std::string::npos) << text;
  EXPECT_NE(text.find("Schema validation passed"), std::string::npos) << text;
  EXPECT_NE(text.find("Wrote schema: "), std::string::npos) << text;
}

TEST(GeneratorDriverTest, QuietWithoutVerbose)
{
  const ScopedTempDir dir("schema_gen_drv_quiet");
  const fs::path input = dir / "q.json";
  ASSERT_TRUE(write_all(input, "null"));

  std::ostringstream log;
  DriverOptions options;
  options.log = &log;

  ASSERT_TRUE(GeneratorDriver::process_single_file(input, options).success);
  EXPECT_TRUE(log.str().empty());
}

// ============================================================================
// Batch
// ============================================================================

TEST(GeneratorDriverBatchTest, ContinuesPastFailures)
{
  const ScopedTempDir dir("schema_gen_drv_batch");
  ASSERT_TRUE(write_all(dir / "a.json", R"({"x": 1})"));
  ASSERT_TRUE(write_all(dir / "b.json", "{oops"));
  ASSERT_TRUE(write_all(dir / "c.json", R"(["y"])"));

  DriverOptions options;
  options.output = dir / "ignored.json";

  const BatchResult result =
    GeneratorDriver::process_batch((dir.path() / "*.json").string(), options);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.files.size(), 3U);
  EXPECT_EQ(result.processed, 2U);
  EXPECT_EQ(result.failure_count(), 1U);

  EXPECT_TRUE(result.files[0].success);
  EXPECT_FALSE(result.files[1].success);
  EXPECT_TRUE(result.files[2].success);
  EXPECT_EQ(result.files[0].output, dir / "a.schema.json");
  EXPECT_EQ(result.files[2].output, dir / "c.schema.json");
  EXPECT_FALSE(fs::exists(dir / "ignored.json"));

  EXPECT_FALSE(result.diagnostics.has_errors());
  ASSERT_TRUE(result.diagnostics.has_warnings());
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_output_ignored));
}

TEST(GeneratorDriverBatchTest, NoWarningWithoutOutput)
{
  const ScopedTempDir dir("schema_gen_drv_batch_nowarn");
  ASSERT_TRUE(write_all(dir / "a.json", "{}"));

  const BatchResult result =
    GeneratorDriver::process_batch((dir.path() / "*.json").string(), {});

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(GeneratorDriverBatchTest, RerunIncludesPreviousOutputs)
{
  const ScopedTempDir dir("schema_gen_drv_rerun");
  ASSERT_TRUE(write_all(dir / "a.json", "{}"));

  const std::string pattern = (dir.path() / "*.json").string();
  ASSERT_EQ(GeneratorDriver::process_batch(pattern, {}).processed, 1U);

  // Second run sees a.json and a.schema.json
  const BatchResult second = GeneratorDriver::process_batch(pattern, {});
  EXPECT_EQ(second.files.size(), 2U);
  EXPECT_EQ(second.processed, 2U);
}

TEST(GeneratorDriverBatchTest, EmptyMatchSucceeds)
{
  const ScopedTempDir dir("schema_gen_drv_empty");

  const BatchResult result =
    GeneratorDriver::process_batch((dir.path() / "*.json").string(), {});

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.processed, 0U);
  EXPECT_TRUE(result.files.empty());
}
