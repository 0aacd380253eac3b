// schema_gen/basic/diagnostic_printer.hpp
//
// Prints diagnostics with file/line/column or JSON pointer locations and
// source snippets in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "schema_gen/basic/diagnostic.hpp"
#include "schema_gen/basic/source_file.hpp"

namespace schema_gen
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: invalid JSON: syntax error while parsing object key
 *     --> data/user.json:1:2
 *         |
 *       1 | {invalid: json}
 *         |  ^ unexpected character
 *
 * Schema checker diagnostics have no source text and print their
 * JSON pointer instead:
 *   error[E0301]: "minItems" must be a non-negative integer
 *     --> user.schema.json at /properties/tags
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param diag Diagnostic to print
   * @param source Text the diagnostic labels point into (may be null)
   */
  void print(const Diagnostic & diag, const SourceFile * source = nullptr);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags, const SourceFile * source = nullptr);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_location(const Diagnostic & diag, const SourceFile * source);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace schema_gen
