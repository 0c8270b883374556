// tests/unit/basic/test_diagnostic_printer.cpp - Unit tests for diagnostic rendering
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/diagnostic_printer.hpp"
#include "ouro/basic/source_manager.hpp"
#include "ouro/driver/compiler.hpp"

using namespace ouro;

TEST(DiagnosticPrinterTest, RendersTypeMismatchWithSourceLine)
{
  auto result = Compiler::compile_source("var x: String = 42;\n", "", {});
  ASSERT_FALSE(result.success());
  ASSERT_EQ(result.diagnostics.size(), 1u);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(result.diagnostics, *result.source);
  printer.print_summary(result.diagnostics);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[S"), std::string::npos) << text;
  EXPECT_NE(text.find("<input>:1:17"), std::string::npos) << text;
  EXPECT_NE(text.find("var x: String = 42;"), std::string::npos) << text;
  EXPECT_NE(text.find("^^"), std::string::npos) << text;
  EXPECT_NE(text.find("1 error generated"), std::string::npos) << text;
}

TEST(DiagnosticPrinterTest, SecondaryLabelsUseDashes)
{
  auto result = Compiler::compile_source("var a = 1;\nvar a = 2;\n", "", {});
  ASSERT_EQ(result.diagnostics.size(), 1u);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(result.diagnostics.all()[0], *result.source);

  const std::string text = out.str();
  EXPECT_NE(text.find("    2 | var a = 2;"), std::string::npos) << text;
  const size_t previous = text.find("    1 | var a = 1;");
  ASSERT_NE(previous, std::string::npos) << text;
  EXPECT_NE(text.find('-', previous + 18), std::string::npos) << text;
}

TEST(DiagnosticPrinterTest, DiagnosticWithoutRangeHasNoSourceLine)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange{}, "unable to read 'x.ouro'").with_code("D0001");
  const SourceFile empty("x.ouro", "");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, empty);

  const std::string text = out.str();
  EXPECT_EQ(text.rfind("error[D0001]: unable to read 'x.ouro'", 0), 0u) << text;
  EXPECT_EQ(text.find(" | "), std::string::npos) << text;
}

TEST(DiagnosticPrinterTest, SummaryPluralizesAndSkipsClean)
{
  DiagnosticBag bag;
  std::ostringstream clean;
  DiagnosticPrinter(clean, false).print_summary(bag);
  EXPECT_TRUE(clean.str().empty());

  bag.report_error(SourceRange{}, "first");
  bag.report_error(SourceRange{}, "second");
  bag.report_warning(SourceRange{}, "ignored in the count");
  std::ostringstream out;
  DiagnosticPrinter(out, false).print_summary(bag);
  EXPECT_EQ(out.str(), "2 errors generated\n");
}
