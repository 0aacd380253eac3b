// schema_gen/driver/generator_driver.cpp - Generator driver implementation
//
#include "schema_gen/driver/generator_driver.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <glob.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

#include "schema_gen/validation/schema_checker.hpp"

namespace schema_gen
{

namespace
{

void progress(const DriverOptions & options, const std::string & message)
{
  if (options.verbose && options.log != nullptr) {
    fmt::print(*options.log, "{}\n", message);
  }
}

/// nlohmann prefixes messages with "[json.exception.<kind>.<id>] "
std::string strip_exception_tag(const std::string & what)
{
  if (!what.empty() && what.front() == '[') {
    const auto close = what.find("] ");
    if (close != std::string::npos) {
      return what.substr(close + 2);
    }
  }
  return what;
}

std::string lowered(std::string text)
{
  for (auto & c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

bool has_accepted_extension(
  const std::filesystem::path & path, const std::vector<std::string> & extensions)
{
  if (extensions.empty()) {
    return true;
  }
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  ext = lowered(ext.substr(1));
  return std::any_of(extensions.begin(), extensions.end(), [&](const std::string & accepted) {
    std::string want = lowered(accepted);
    if (!want.empty() && want.front() == '.') {
      want.erase(0, 1);
    }
    return want == ext;
  });
}

/// Owns a glob_t for the duration of one expansion
class GlobResult
{
public:
  GlobResult() = default;
  GlobResult(const GlobResult &) = delete;
  GlobResult & operator=(const GlobResult &) = delete;
  ~GlobResult() { globfree(&buf_); }

  glob_t * get() { return &buf_; }

private:
  glob_t buf_{};
};

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

std::filesystem::path default_output_path(
  const std::filesystem::path & input, const std::optional<std::filesystem::path> & output_dir)
{
  const std::string file_name = input.stem().string() + ".schema.json";
  if (output_dir) {
    return *output_dir / file_name;
  }
  return input.parent_path() / file_name;
}

std::string serialize_schema(const Json & schema, bool pretty)
{
  return pretty ? schema.dump(2) : schema.dump();
}

std::optional<std::vector<std::filesystem::path>> expand_batch(
  const std::string & pattern, const std::vector<std::string> & extensions, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  GlobResult matches;
  const int rc = ::glob(pattern.c_str(), 0, nullptr, matches.get());

  std::vector<fs::path> files;
  if (rc == GLOB_NOMATCH) {
    return files;
  }
  if (rc != 0) {
    diags.report_error("failed to expand glob pattern '" + pattern + "'")
      .with_code(diag_code::k_batch_failed)
      .with_help(
        rc == GLOB_NOSPACE ? "the expansion ran out of memory"
                           : "a directory in the pattern could not be read");
    return std::nullopt;
  }

  for (size_t i = 0; i < matches.get()->gl_pathc; ++i) {
    fs::path candidate(matches.get()->gl_pathv[i]);
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
      continue;
    }
    if (!has_accepted_extension(candidate, extensions)) {
      continue;
    }
    files.push_back(std::move(candidate));
  }

  std::sort(files.begin(), files.end());
  return files;
}

// ============================================================================
// GeneratorDriver
// ============================================================================

FileResult GeneratorDriver::process_single_file(
  const std::filesystem::path & input, const DriverOptions & options)
{
  FileResult result;
  result.input = input;

  progress(options, fmt::format("Processing input file: {}", input.string()));

  if (!read_input(result)) {
    return result;
  }

  const auto document = parse_input(result);
  if (!document) {
    return result;
  }

  const auto schema = generate(*document, options, result);
  if (!schema) {
    return result;
  }

  emit_schema(*schema, options, result);
  return result;
}

bool GeneratorDriver::emit_schema(
  const Json & schema, const DriverOptions & options, FileResult & result)
{
  if (options.validate) {
    if (!validate(schema, result)) {
      return false;
    }
    progress(options, "Schema validation passed");
  }

  result.output =
    options.output ? *options.output : default_output_path(result.input, options.output_dir);
  if (!write_output(schema, options.pretty, result)) {
    return false;
  }

  progress(options, fmt::format("Wrote schema: {}", result.output.string()));

  result.success = !result.diagnostics.has_errors();
  return result.success;
}

BatchResult GeneratorDriver::process_batch(
  const std::string & pattern, const DriverOptions & options)
{
  BatchResult result;

  const auto files = expand_batch(pattern, options.extensions, result.diagnostics);
  if (!files) {
    return result;
  }

  progress(options, fmt::format("Pattern '{}' matched {} file(s)", pattern, files->size()));

  DriverOptions per_file = options;
  if (per_file.output) {
    result.diagnostics.report_warning("output path is ignored in batch mode")
      .with_code(diag_code::k_output_ignored)
      .with_file(*per_file.output)
      .with_help("use an output directory to collect batch schemas in one place");
    per_file.output.reset();
  }

  for (const auto & file : *files) {
    FileResult file_result = process_single_file(file, per_file);
    if (file_result.success) {
      ++result.processed;
    }
    result.files.push_back(std::move(file_result));
  }

  result.success = true;
  return result;
}

bool GeneratorDriver::read_input(FileResult & result)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(result.input, ec)) {
    result.diagnostics.report_error("file not found: " + result.input.string())
      .with_code(diag_code::k_file_not_found)
      .with_file(result.input);
    return false;
  }

  std::ifstream in(result.input, std::ios::in | std::ios::binary);
  if (!in || !fs::is_regular_file(result.input, ec)) {
    result.diagnostics.report_error("failed to read input file: " + result.input.string())
      .with_code(diag_code::k_read_failed)
      .with_file(result.input);
    return false;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    result.diagnostics.report_error("failed to read input file: " + result.input.string())
      .with_code(diag_code::k_read_failed)
      .with_file(result.input);
    return false;
  }

  result.source = std::make_unique<SourceFile>(result.input, buffer.str());
  return true;
}

std::optional<Json> GeneratorDriver::parse_input(FileResult & result)
{
  const std::string_view text = result.source->content();
  try {
    return Json::parse(text.begin(), text.end());
  } catch (const Json::parse_error & e) {
    // e.byte is 1-based and may point one past the end on truncated input
    const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
    const auto offset = static_cast<uint32_t>(std::min(byte, text.size()));
    result.diagnostics.report_error("invalid JSON: " + strip_exception_tag(e.what()))
      .with_code(diag_code::k_invalid_json)
      .with_file(result.input)
      .with_label(SourceRange::at(offset), "syntax error");
    return std::nullopt;
  }
}

std::optional<Json> GeneratorDriver::generate(
  const Json & document, const DriverOptions & options, FileResult & result)
{
  GenerateOptions generate_options;
  generate_options.tier = options.tier;
  generate_options.overflow = options.overflow;

  try {
    return generate_schema(document, generate_options);
  } catch (const UnsupportedValueKind & e) {
    result.diagnostics.report_error(std::string("unsupported value: ") + e.what())
      .with_code(diag_code::k_unsupported_value)
      .with_file(result.input);
  } catch (const NumericRangeOverflow & e) {
    result.diagnostics.report_error(std::string("numeric range overflow: ") + e.what())
      .with_code(diag_code::k_numeric_overflow)
      .with_file(result.input)
      .with_help("use '--overflow saturate' to clamp bounds to the representable range");
  }
  return std::nullopt;
}

bool GeneratorDriver::validate(const Json & schema, FileResult & result)
{
  DiagnosticBag violations = check_schema(schema);
  if (!violations.has_errors()) {
    result.validated = true;
    return true;
  }

  result.diagnostics.report_error("schema validation failed")
    .with_code(diag_code::k_schema_violation)
    .with_file(result.input);
  result.diagnostics.merge(std::move(violations));
  return false;
}

bool GeneratorDriver::write_output(const Json & schema, bool pretty, FileResult & result)
{
  namespace fs = std::filesystem;

  const fs::path parent = result.output.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      result.diagnostics.report_error(
        "failed to create output directory: " + parent.string() + ": " + ec.message())
        .with_code(diag_code::k_write_failed)
        .with_file(result.output);
      return false;
    }
  }

  std::ofstream out(result.output, std::ios::out | std::ios::trunc | std::ios::binary);
  if (out) {
    out << serialize_schema(schema, pretty);
  }
  if (!out) {
    result.diagnostics.report_error("failed to write schema to file: " + result.output.string())
      .with_code(diag_code::k_write_failed)
      .with_file(result.output);
    return false;
  }
  return true;
}

}  // namespace schema_gen
