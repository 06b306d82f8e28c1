// test_loader.cpp - Unit tests for DatabaseLoader
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "bibdb/driver/loader.hpp"
#include "bibdb/test_support/parse_helpers.hpp"

using namespace bibdb;
using bibdb::test_support::has_message;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / name)
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  std::filesystem::path write(const std::string & rel, const std::string & text) const
  {
    const auto p = path / rel;
    std::ofstream(p) << text;
    return p;
  }
};

}  // namespace

TEST(DriverLoader, CrossrefAcrossFiles)
{
  const TempDir dir("bibdb_loader_xref");
  const auto a = dir.write("a.bib", "@inproceedings{p1, title = {T}, crossref = {conf}}\n");
  const auto b = dir.write("b.bib", "@proceedings{conf, booktitle = {Proc.}, year = 2001}\n");

  const auto result = DatabaseLoader::load_files({a, b});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.database.size(), 2U);

  const auto merged = resolve_crossref(result.database.at("p1"), result.database);
  EXPECT_EQ(*merged->find("booktitle"), "Proc.");

  // Positions resolve through the parser kept in the result
  const auto & sources = result.parser->sources();
  const auto pos = result.database.at("conf")->pos();
  EXPECT_EQ(sources.name(pos.file_id()), b.string());
  EXPECT_EQ(sources.line_column(pos).line, 1U);
}

TEST(DriverLoader, MacrosCarryAcrossFiles)
{
  const TempDir dir("bibdb_loader_macros");
  const auto a = dir.write("a.bib", "@string{pub = \"ACM\"}\n");
  const auto b = dir.write("b.bib", "@book{k, publisher = pub, month = sep}\n");

  const auto result = DatabaseLoader::load_files({a, b}, syntax::MonthStyle::Abbrv);
  ASSERT_TRUE(result.success);
  const auto k = result.database.at("k");
  EXPECT_EQ(*k->find("publisher"), "ACM");
  EXPECT_EQ(*k->find("month"), "Sept.");
}

TEST(DriverLoader, MissingFileDoesNotStopLaterFiles)
{
  const TempDir dir("bibdb_loader_missing");
  const auto good = dir.write("good.bib", "@misc{ok}\n");

  std::ostringstream log;
  LoadOptions options;
  options.log_stream = &log;
  const auto result =
    DatabaseLoader::load_files({dir.path / "missing.bib", good}, syntax::MonthStyle::Full, options);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_message(result.diagnostics, "cannot open file"));
  EXPECT_TRUE(result.database.contains("ok"));
  EXPECT_NE(log.str().find("error: cannot open file"), std::string::npos);
}

TEST(DriverLoader, CollectsErrorsFromEveryStage)
{
  const TempDir dir("bibdb_loader_errors");
  const auto a = dir.write("a.bib", "@misc{dup}\n@misc{x, crossref = {nowhere}}\n");
  const auto b = dir.write("b.bib", "@misc{DUP}\n");

  const auto result = DatabaseLoader::load_files({a, b});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.size(), 2U);
  EXPECT_TRUE(has_message(result.diagnostics, "repeated entry"));
  EXPECT_TRUE(has_message(result.diagnostics, "unknown crossref `nowhere'"));
  EXPECT_EQ(result.database.size(), 2U);
}

TEST(DriverLoader, ProjectConfigMacrosAndOrder)
{
  const TempDir dir("bibdb_loader_project");
  dir.write("one.bib", "@article{a, journal = jcp, month = jan}\n");
  dir.write("two.bib", "@string{jcp = \"Overridden\"}\n@article{b, journal = jcp}\n");

  ProjectConfig config;
  config.project_root = dir.path;
  config.parser.month_style = syntax::MonthStyle::None;
  config.sources = {"one.bib", "two.bib"};
  config.macros = {{"JCP", "J. Chem. Phys."}};

  const auto result = DatabaseLoader::load_project(config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(*result.database.at("a")->find("journal"), "J. Chem. Phys.");
  // No month macros with month_style none
  EXPECT_EQ(*result.database.at("a")->find("month"), "");
  EXPECT_EQ(*result.database.at("b")->find("journal"), "Overridden");

  // The @string redefinition and the unknown month macro are logged
  EXPECT_TRUE(has_message(result.parser->log(), "macro `jcp' redefined"));
  EXPECT_TRUE(has_message(result.parser->log(), "unknown macro `jan'"));
}
