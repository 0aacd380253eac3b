// schema_gen/basic/diagnostic.hpp - Diagnostic types for the driver and schema checker
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "schema_gen/basic/source_file.hpp"

namespace schema_gen
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{
inline constexpr const char * k_file_not_found = "E0001";
inline constexpr const char * k_read_failed = "E0002";
inline constexpr const char * k_write_failed = "E0003";
inline constexpr const char * k_invalid_json = "E0101";
inline constexpr const char * k_unsupported_value = "E0102";
inline constexpr const char * k_numeric_overflow = "E0201";
inline constexpr const char * k_schema_violation = "E0301";
inline constexpr const char * k_batch_failed = "E0401";
inline constexpr const char * k_config_error = "E0501";
inline constexpr const char * k_output_ignored = "W0401";
}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/// Points into the SourceFile the diagnostic was produced for.
struct Label
{
  SourceRange range;
  std::string message;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E0101"
  std::string message;

  /// File the diagnostic refers to (empty if none)
  std::filesystem::path file;

  /// JSON pointer into a document (schema checker), e.g. "/properties/age"
  std::optional<std::string> json_pointer;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// The first label, where the caret goes
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and commits it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_file(std::filesystem::path file);

  DiagnosticBuilder & with_pointer(std::string json_pointer);

  DiagnosticBuilder & with_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::string message);
  DiagnosticBuilder report_warning(std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// True if any diagnostic carries the given code
  [[nodiscard]] bool has_code(const std::string & code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(Severity severity, std::string message);

  std::vector<Diagnostic> diagnostics_;
};

/// Lower-case severity name ("error" or "warning")
[[nodiscard]] const char * to_string(Severity severity) noexcept;

}  // namespace schema_gen
