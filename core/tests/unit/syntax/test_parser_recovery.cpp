#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "bibdb/syntax/parser.hpp"
#include "bibdb/test_support/parse_helpers.hpp"

using bibdb::syntax::Parser;
using bibdb::syntax::ParserOptions;
using bibdb::test_support::has_message;
using bibdb::test_support::parse;

TEST(BibParserRecovery, DuplicateKeyKeepsFirstEntry)
{
  auto unit = parse(
    "@article{sameKey, title = {First}}\n"
    "@article{SAMEKEY, title = {Second}}\n");

  ASSERT_EQ(unit.parse_errors.size(), 1U);
  EXPECT_EQ(unit.parse_errors.all()[0].message, "repeated entry");
  ASSERT_EQ(unit.db.size(), 1U);
  const auto e = unit.db.find("samekey");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->key(), "sameKey");
  EXPECT_EQ(*e->find("title"), "First");

  // The error also points back at the first definition
  const auto & d = unit.parse_errors.all()[0];
  EXPECT_EQ(unit.line_column(d.span.begin).line, 2U);
  EXPECT_EQ(d.span.length, 7U);
  EXPECT_EQ(d.entry_key, "SAMEKEY");
  ASSERT_TRUE(d.related.has_value());
  EXPECT_EQ(unit.line_column(d.related->span.begin).line, 1U);
  EXPECT_EQ(d.related->message, "first defined here");
}

TEST(BibParserRecovery, ErrorSkipsOnlyOneEntry)
{
  auto unit = parse(
    "@misc{a, note = {ok}}\n"
    "@misc{b, note = }\n"
    "@misc{c, note = {ok}}\n");

  EXPECT_TRUE(has_message(unit.parse_errors, "expected string, number, or macro name"));
  EXPECT_EQ(unit.parse_errors.size(), 1U);
  EXPECT_TRUE(unit.db.contains("a"));
  EXPECT_FALSE(unit.db.contains("b"));
  EXPECT_TRUE(unit.db.contains("c"));
}

TEST(BibParserRecovery, AllErrorsOfOneCallAreBundled)
{
  Parser parser;
  const auto result = parser.parse(
    "@misc{a title = {x}}\n"
    "@misc{b, title {x}}\n"
    "@misc{c, title = {x}}\n"
    "@misc{d, 9title = {x}}\n");

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 3U);
  EXPECT_EQ(result.diagnostics.all()[0].message, "expected } or ,");
  EXPECT_EQ(result.diagnostics.all()[1].message, "expected = after field name");
  EXPECT_EQ(result.diagnostics.all()[2].message, "expected identifier");
  EXPECT_EQ(parser.database().size(), 1U);
  EXPECT_TRUE(parser.database().contains("c"));
}

TEST(BibParserRecovery, ParenthesizedEntryExpectsCloseParen)
{
  Parser parser;
  const auto result = parser.parse("@misc(a title = {x})");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_message(result.diagnostics, "expected ) or ,"));
}

TEST(BibParserRecovery, UnexpectedCloseBrace)
{
  auto unit = parse("@misc{a, note = \"x}y\"}\n@misc{b}");
  EXPECT_TRUE(has_message(unit.parse_errors, "unexpected }"));
  EXPECT_TRUE(unit.db.contains("b"));
}

TEST(BibParserRecovery, UnterminatedString)
{
  auto unit = parse("@misc{a, note = {never closed");
  ASSERT_EQ(unit.parse_errors.size(), 1U);
  EXPECT_EQ(unit.parse_errors.all()[0].message, "unterminated string");
  EXPECT_TRUE(unit.db.empty());
}

TEST(BibParserRecovery, MissingDelimiterAfterType)
{
  auto unit = parse("@misc k, note = {x}\n@misc{ok}");
  EXPECT_TRUE(has_message(unit.parse_errors, "expected { or ( after entry type"));
  EXPECT_TRUE(unit.db.contains("ok"));
}

TEST(BibParserRecovery, MissingTypeIdentifier)
{
  auto unit = parse("email me @{x}\n@misc{ok}");
  EXPECT_TRUE(has_message(unit.parse_errors, "expected identifier"));
  EXPECT_TRUE(unit.db.contains("ok"));
}

TEST(BibParserRecovery, BadStringCommandDefinesNothing)
{
  auto unit = parse(
    "@string{x {value}}\n"
    "@string{y = {value}\n"
    "@misc{k, a = x}\n");
  EXPECT_TRUE(has_message(unit.parse_errors, "expected = after string name"));
  EXPECT_TRUE(has_message(unit.parse_errors, "expected }"));
  EXPECT_FALSE(unit.parser->macros().contains("x"));
  EXPECT_FALSE(unit.parser->macros().contains("y"));
  EXPECT_TRUE(unit.db.contains("k"));
}

TEST(BibParserRecovery, UnknownCrossrefFailsFinalize)
{
  auto unit = parse("@inproceedings{a, crossref = {Missing}}");
  EXPECT_TRUE(unit.parse_errors.empty());
  ASSERT_EQ(unit.finalize_errors.size(), 1U);
  EXPECT_EQ(unit.finalize_errors.all()[0].message, "unknown crossref `Missing'");
  // The database is still handed out
  EXPECT_TRUE(unit.db.contains("a"));
}

TEST(BibParserRecovery, CrossrefMatchesCaseInsensitively)
{
  auto unit = parse(
    "@inproceedings{a, crossref = {CONF}}\n"
    "@proceedings{conf, title = {Proc.}}\n");
  EXPECT_FALSE(unit.has_errors());
}

TEST(BibParserRecovery, FinalizeSealsTheSession)
{
  Parser parser;
  EXPECT_TRUE(parser.parse("@misc{a}").success);
  auto first = parser.finalize();
  EXPECT_TRUE(first.success);
  EXPECT_TRUE(parser.finalized());

  const auto late = parser.parse("@misc{b}");
  EXPECT_FALSE(late.success);
  const auto again = parser.finalize();
  EXPECT_FALSE(again.success);
  EXPECT_TRUE(again.database.empty());
  EXPECT_EQ(first.database.size(), 1U);
}

TEST(BibParserRecovery, LogStreamReceivesRenderedDiagnostics)
{
  std::ostringstream log;
  ParserOptions options;
  options.log_stream = &log;
  Parser parser(options);

  const auto result = parser.parse("@misc{k, note = nomacro}\n@misc{k}\n", "refs.bib");
  EXPECT_FALSE(result.success);

  const std::string out = log.str();
  EXPECT_NE(out.find("warning: unknown macro `nomacro'"), std::string::npos);
  EXPECT_NE(out.find("refs.bib:1:17"), std::string::npos);
  EXPECT_NE(out.find("error: repeated entry"), std::string::npos);
  EXPECT_NE(out.find("refs.bib:2:7"), std::string::npos);
  EXPECT_NE(out.find(" = help: define it with @string{nomacro = \"...\"} before use\n"), std::string::npos);
  EXPECT_NE(out.find(" = entry: k\n"), std::string::npos);
  EXPECT_NE(out.find("- first defined here"), std::string::npos);
}
