// tests/unit/basic/test_diagnostic_printer.cpp - Plain-text diagnostic rendering

#include <gtest/gtest.h>

#include <sstream>

#include "schema_gen/basic/diagnostic_printer.hpp"

using namespace schema_gen;

namespace
{

std::string render(const DiagnosticBag & bag, const SourceFile * source)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(bag, source);
  return out.str();
}

}  // namespace

TEST(DiagnosticPrinterTest, SyntaxErrorWithSnippet)
{
  const SourceFile source("/nonexistent/bad.json", "{invalid: json}");

  DiagnosticBag bag;
  bag.report_error("invalid JSON: syntax error")
    .with_code(diag_code::k_invalid_json)
    .with_file(source.path())
    .with_label(SourceRange::at(1), "syntax error");

  const std::string out = render(bag, &source);

  EXPECT_NE(out.find("error[E0101]: invalid JSON: syntax error\n"), std::string::npos) << out;
  EXPECT_NE(out.find("bad.json:1:2"), std::string::npos) << out;
  EXPECT_NE(out.find("{invalid: json}"), std::string::npos) << out;
  EXPECT_NE(out.find(" ^ syntax error"), std::string::npos) << out;
}

TEST(DiagnosticPrinterTest, PointerLocationWithoutSource)
{
  DiagnosticBag bag;
  bag.report_error("'minItems' must be a non-negative integer")
    .with_code(diag_code::k_schema_violation)
    .with_pointer("/properties/tags/minItems")
    .with_help("generated schemas must satisfy the meta-schema");

  const std::string out = render(bag, nullptr);

  EXPECT_NE(out.find("error[E0301]:"), std::string::npos) << out;
  EXPECT_NE(out.find("<document> at /properties/tags/minItems"), std::string::npos) << out;
  EXPECT_NE(out.find("= help: generated schemas must satisfy the meta-schema"), std::string::npos)
    << out;
}

TEST(DiagnosticPrinterTest, ErrorsPrintBeforeWarnings)
{
  DiagnosticBag bag;
  bag.report_warning("later");
  bag.report_error("first");

  const std::string out = render(bag, nullptr);

  const auto error_pos = out.find("error: first");
  const auto warning_pos = out.find("warning: later");
  ASSERT_NE(error_pos, std::string::npos) << out;
  ASSERT_NE(warning_pos, std::string::npos) << out;
  EXPECT_LT(error_pos, warning_pos);
}

TEST(DiagnosticPrinterTest, NoLocationLineWithoutFileOrPointer)
{
  DiagnosticBag bag;
  bag.report_error("input file is required");

  const std::string out = render(bag, nullptr);

  EXPECT_EQ(out, "error: input file is required\n\n");
}
