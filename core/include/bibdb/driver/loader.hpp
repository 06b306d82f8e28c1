// bibdb/driver/loader.hpp - Build a Database from a project or a file list
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <vector>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/model/database.hpp"
#include "bibdb/project/project_config.hpp"
#include "bibdb/syntax/parser.hpp"

namespace bibdb
{

struct LoadOptions
{
  /// Print diagnostics here as they are reported (nullptr = silent)
  std::ostream * log_stream = nullptr;

  /// Terminal colors for log_stream output
  bool use_color = false;
};

struct LoadResult
{
  /// Whether every source parsed and every crossref resolved
  bool success = false;

  /// Errors from all sources and from finalization
  DiagnosticBag diagnostics;

  /// Everything that parsed, even when success is false
  Database database;

  /// The session that produced the database; owns the source texts that
  /// diagnostic and entry positions refer to, and the warning log
  std::unique_ptr<syntax::Parser> parser;
};

class DatabaseLoader
{
public:
  /**
   * Load the database described by a project configuration.
   *
   * Config macros are declared first, then sources are parsed in order.
   * A failing source does not stop later ones from being parsed.
   */
  [[nodiscard]] static LoadResult load_project(
    const ProjectConfig & config, const LoadOptions & options = {});

  /// Same as load_project for a bare file list and no macros
  [[nodiscard]] static LoadResult load_files(
    const std::vector<std::filesystem::path> & files,
    syntax::MonthStyle month_style = syntax::MonthStyle::Full, const LoadOptions & options = {});

private:
  static LoadResult run(
    std::unique_ptr<syntax::Parser> parser, const std::vector<std::filesystem::path> & files);
};

}  // namespace bibdb
