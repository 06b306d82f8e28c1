// test_diagnostic_printer.cpp - Unit tests for diagnostic collection and output
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/basic/diagnostic_printer.hpp"
#include "bibdb/basic/source_manager.hpp"

namespace bibdb
{

namespace
{

std::string render(const Diagnostic & diag, const SourceRegistry & reg)
{
  std::ostringstream out;
  DiagnosticPrinter(out, reg).print(diag);
  return out.str();
}

}  // namespace

TEST(BasicDiagnostic, BagKeepsReportingOrder)
{
  DiagnosticBag bag;
  bag.error(SourceSpan{SourceLocation(FileId{0}, 1), 2}, "bad").set_help("fix it");
  bag.warning({}, "meh");

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.count(Severity::Error), 1U);
  EXPECT_EQ(bag.count(Severity::Warning), 1U);
  EXPECT_EQ(bag.all()[0].help, "fix it");
  EXPECT_EQ(bag.all()[0].span.length, 2U);
  EXPECT_EQ(bag.all()[1].severity, Severity::Warning);
}

TEST(BasicDiagnostic, Append)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.error({}, "one");
  b.error({}, "two");
  b.warning({}, "three");
  a.append(std::move(b));
  ASSERT_EQ(a.size(), 3U);
  EXPECT_EQ(a.all()[1].message, "two");
  EXPECT_TRUE(b.empty());

  DiagnosticBag empty;
  empty.append(std::move(a));
  EXPECT_EQ(empty.size(), 3U);
}

TEST(BasicDiagnosticPrinter, WarningWithHelp)
{
  SourceRegistry reg;
  const FileId id = reg.add("refs.bib", "@misc{k, x = foo}");

  DiagnosticBag bag;
  bag.warning(SourceSpan{SourceLocation(id, 13), 3}, "unknown macro `foo'")
    .set_help("define it with @string{foo = \"...\"} before use");

  EXPECT_EQ(
    render(bag.all().front(), reg),
    "warning: unknown macro `foo'\n"
    " --> refs.bib:1:14\n"
    "  |\n"
    "1 | @misc{k, x = foo}\n"
    "  |              ^^^\n"
    "  = help: define it with @string{foo = \"...\"} before use\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, RepeatedEntryShowsBothDefinitions)
{
  SourceRegistry reg;
  std::string text = "@misc{a}\n";
  for (int i = 0; i < 9; ++i) {
    text += "\n";
  }
  text += "@misc{A}";
  const FileId id = reg.add("refs.bib", text);

  DiagnosticBag bag;
  bag.error(SourceSpan{SourceLocation(id, 24), 1}, "repeated entry")
    .set_label("`A' already defined")
    .set_related(SourceSpan{SourceLocation(id, 0)}, "first defined here")
    .set_entry("A");

  // The gutter is as wide as the largest line number shown
  EXPECT_EQ(
    render(bag.all().front(), reg),
    "error: repeated entry\n"
    "  --> refs.bib:11:7\n"
    "   |\n"
    "11 | @misc{A}\n"
    "   |       ^ `A' already defined\n"
    "  ::: refs.bib:1:1\n"
    "   |\n"
    " 1 | @misc{a}\n"
    "   | - first defined here\n"
    "   = entry: A\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, TabsKeepMarkersAligned)
{
  SourceRegistry reg;
  const FileId id = reg.add("refs.bib", "\tnote = x");

  DiagnosticBag bag;
  bag.warning(SourceSpan{SourceLocation(id, 8), 1}, "unknown macro `x'");

  const std::string out = render(bag.all().front(), reg);
  EXPECT_NE(out.find("1 |  note = x\n"), std::string::npos);
  EXPECT_NE(out.find("  |         ^\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, NoLocation)
{
  SourceRegistry reg;
  DiagnosticBag bag;
  bag.error({}, "cannot open file: missing.bib")
    .set_related({}, "while loading the project");

  EXPECT_EQ(
    render(bag.all().front(), reg),
    "error: cannot open file: missing.bib\n"
    "  = note: while loading the project\n"
    "\n");
}

}  // namespace bibdb
