// test_diagnostic.cpp - Tests for DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <utility>

#include "metadoc/basic/diagnostic.hpp"
#include "metadoc/basic/diagnostic_printer.hpp"

using metadoc::DiagnosticBag;
using metadoc::DiagnosticPrinter;
using metadoc::Severity;

// =============================================================================
// DiagnosticBag
// =============================================================================

TEST(DiagnosticBagTest, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_warning("failed to decode semantic metadata");
    builder.with_code("W001").with_subject("out/A.semanticdb").with_note("truncated");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);

  const auto & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "W001");
  ASSERT_TRUE(d.subject.has_value());
  EXPECT_EQ(*d.subject, "out/A.semanticdb");
  ASSERT_EQ(d.notes.size(), 1U);
  EXPECT_EQ(d.notes.front(), "truncated");
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(DiagnosticBagTest, ErrorsAndWarningsAreFiltered)
{
  DiagnosticBag bag;
  bag.report_warning("skipped");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());

  bag.report_error("failed to write site");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.size(), 2U);
}

TEST(DiagnosticBagTest, MovedBuilderCommitsOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_error("failed to write site");
    auto second = std::move(first);
    second.with_code("E002");
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all().front().code, "E002");
}

// =============================================================================
// DiagnosticPrinter
// =============================================================================

TEST(DiagnosticPrinterTest, PrintsRustStyleWithoutColor)
{
  DiagnosticBag bag;
  bag.report_warning("failed to decode semantic metadata")
    .with_code("W001")
    .with_subject("/nonexistent/classes/A.scala.semanticdb")
    .with_note("malformed semanticdb payload")
    .with_help("the file was skipped");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W001]: failed to decode semantic metadata\n"), std::string::npos);
  EXPECT_NE(text.find("  --> /nonexistent/classes/A.scala.semanticdb\n"), std::string::npos);
  EXPECT_NE(text.find("   = note: malformed semanticdb payload\n"), std::string::npos);
  EXPECT_NE(text.find("   = help: the file was skipped\n"), std::string::npos);
  EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(DiagnosticPrinterTest, ErrorsArePrintedFirst)
{
  DiagnosticBag bag;
  bag.report_warning("skipped B");
  bag.report_error("failed to write site");
  bag.report_warning("skipped C");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  const auto error_at = text.find("error: failed to write site");
  const auto b_at = text.find("warning: skipped B");
  const auto c_at = text.find("warning: skipped C");
  ASSERT_NE(error_at, std::string::npos);
  ASSERT_NE(b_at, std::string::npos);
  ASSERT_NE(c_at, std::string::npos);
  EXPECT_LT(error_at, b_at);
  EXPECT_LT(b_at, c_at);
}
