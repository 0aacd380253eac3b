// schema_gen/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "schema_gen/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace schema_gen
{

namespace
{

std::string display_path(const std::filesystem::path & path)
{
  std::error_code ec;
  auto rel_path = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  if (ec || rel_path.empty()) {
    return path.string();
  }
  const std::string rel = rel_path.string();
  // Paths outside the working directory read better absolute
  return rel.rfind("..", 0) == 0 ? path.string() : rel;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile * source)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  print_location(diag, source);

  // === Labels (source snippets) ===
  if (source != nullptr) {
    bool printed_gutter = false;
    for (const auto & label : diag.labels) {
      if (!label.range.is_valid()) {
        continue;
      }
      if (!printed_gutter) {
        fmt::print(os_, "{}\n", gutter_pipe());
        printed_gutter = true;
      }
      print_label_context(label, *source);
    }
  }

  // Labels without a range still carry a message worth showing
  for (const auto & label : diag.labels) {
    if (!label.range.is_valid() && !label.message.empty()) {
      print_note(label.message);
    }
  }

  // === Help message ===
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile * source)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  // Errors before warnings, otherwise keep report order
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return static_cast<int>(a.severity) < static_cast<int>(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
    }
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
    }
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceFile * source)
{
  std::filesystem::path file = diag.file;
  if (file.empty() && source != nullptr) {
    file = source->path();
  }
  if (file.empty() && !diag.json_pointer) {
    return;
  }

  std::string location = file.empty() ? std::string("<document>") : display_path(file);

  const SourceRange primary = diag.primary_range();
  if (source != nullptr && primary.is_valid()) {
    const FullSourceRange fr = source->get_full_range(primary);
    if (fr.is_valid()) {
      location = fmt::format("{}:{}:{}", location, fr.start_line, fr.start_column);
    }
  }

  if (diag.json_pointer) {
    const std::string & pointer = *diag.json_pointer;
    location = fmt::format("{} at {}", location, pointer.empty() ? "/" : pointer);
  }

  fmt::print(os_, "{} {}\n", gutter_arrow(), location);
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(source, fr.start_line - 1, fr.start_column, end_col, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);

  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (handle tabs)
  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < start_col && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    visual_col++;
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);

  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    if (!label_message.empty()) {
      fmt::print(os_, " {}", label_message);
    }
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    if (!label_message.empty()) {
      fmt::print(os_, " {}", label_message);
    }
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace schema_gen
