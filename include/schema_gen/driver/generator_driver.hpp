// schema_gen/driver/generator_driver.hpp - Generator driver
//
// Single entry point for the file pipeline: read, parse, generate,
// optionally check, write. Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "schema_gen/basic/diagnostic.hpp"
#include "schema_gen/basic/source_file.hpp"
#include "schema_gen/schema/generator.hpp"

namespace schema_gen
{

// ============================================================================
// Driver Options
// ============================================================================

struct DriverOptions
{
  Tier tier = Tier::Standard;

  OverflowPolicy overflow = OverflowPolicy::Saturate;

  /// Indent the written schema by two spaces
  bool pretty = false;

  /// Run the schema checker before writing
  bool validate = false;

  /// Explicit output file (single-file mode only)
  std::optional<std::filesystem::path> output;

  /// Directory for default output paths (created when missing)
  std::optional<std::filesystem::path> output_dir;

  /// Extensions (without dot) accepted by batch expansion; empty = any
  std::vector<std::string> extensions = {"json"};

  /// Enable progress output
  bool verbose = false;

  /// Progress sink, used only when verbose is set
  std::ostream * log = nullptr;
};

// ============================================================================
// Results
// ============================================================================

struct FileResult
{
  /// Whether the schema was generated and written
  bool success = false;

  std::filesystem::path input;

  /// Output path (set once it has been decided)
  std::filesystem::path output;

  DiagnosticBag diagnostics;

  /// Input text, for rendering source labels (null if it was never read)
  std::unique_ptr<SourceFile> source;

  /// The produced schema passed the schema checker
  bool validated = false;
};

struct BatchResult
{
  /// False only when the pattern itself could not be expanded
  bool success = false;

  /// Number of files processed successfully
  size_t processed = 0;

  /// Per-file results, in expansion order
  std::vector<FileResult> files;

  /// Pattern-level diagnostics (per-file ones stay in files)
  DiagnosticBag diagnostics;

  [[nodiscard]] size_t failure_count() const { return files.size() - processed; }
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * Output path used when none is given: `<stem>.schema.json` beside the
 * input, or inside output_dir when one is set.
 */
[[nodiscard]] std::filesystem::path default_output_path(
  const std::filesystem::path & input,
  const std::optional<std::filesystem::path> & output_dir = std::nullopt);

/// Compact JSON, or two-space indentation when pretty is set
[[nodiscard]] std::string serialize_schema(const Json & schema, bool pretty);

/**
 * Expand a glob pattern into a sorted list of regular files.
 *
 * A pattern that matches nothing yields an empty list. Errors from the
 * expansion itself are reported as E0401 and yield std::nullopt.
 *
 * @param pattern POSIX glob pattern
 * @param extensions Accepted extensions without dot; empty accepts any
 * @param diags Receives expansion errors
 */
[[nodiscard]] std::optional<std::vector<std::filesystem::path>> expand_batch(
  const std::string & pattern, const std::vector<std::string> & extensions, DiagnosticBag & diags);

// ============================================================================
// GeneratorDriver
// ============================================================================

/**
 * Driver that orchestrates the per-file pipeline.
 *
 * The pipeline consists of:
 * 1. Reading the input (E0001 / E0002)
 * 2. Parsing it, keeping key order (E0101)
 * 3. Schema generation (E0102 / E0201)
 * 4. Optional schema check (E0301)
 * 5. Writing the output (E0003)
 */
class GeneratorDriver
{
public:
  /**
   * Generate the schema for one file.
   *
   * @param input Path to the JSON document
   * @param options Driver options
   * @return FileResult with success status and diagnostics
   */
  [[nodiscard]] static FileResult process_single_file(
    const std::filesystem::path & input, const DriverOptions & options);

  /**
   * Check (when options.validate is set) and write an already generated
   * schema for result.input.
   *
   * Nothing is written when the check fails. The output path is
   * options.output, else the default path for result.input.
   *
   * @return true when the schema was written; result.success mirrors it
   */
  static bool emit_schema(const Json & schema, const DriverOptions & options, FileResult & result);

  /**
   * Generate schemas for every file a glob pattern matches.
   *
   * options.output is ignored with a W0401 warning; each file gets its
   * default output path. A failing file does not stop the batch.
   */
  [[nodiscard]] static BatchResult process_batch(
    const std::string & pattern, const DriverOptions & options);

private:
  static bool read_input(FileResult & result);

  static std::optional<Json> parse_input(FileResult & result);

  static std::optional<Json> generate(
    const Json & document, const DriverOptions & options, FileResult & result);

  static bool validate(const Json & schema, FileResult & result);

  static bool write_output(const Json & schema, bool pretty, FileResult & result);
};

}  // namespace schema_gen
