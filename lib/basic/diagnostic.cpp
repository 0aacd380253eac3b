// schema_gen/basic/diagnostic.cpp - Diagnostic implementation
#include "schema_gen/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace schema_gen
{

const Label * Diagnostic::primary_label() const noexcept
{
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

const char * to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_file(std::filesystem::path file)
{
  diagnostic_.file = std::move(file);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_pointer(std::string json_pointer)
{
  diagnostic_.json_pointer = std::move(json_pointer);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(Severity severity, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(std::string message)
{
  return report(Severity::Error, std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string message)
{
  return report(Severity::Warning, std::move(message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

bool DiagnosticBag::has_code(const std::string & code) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [&code](const Diagnostic & d) {
    return d.code == code;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace schema_gen
