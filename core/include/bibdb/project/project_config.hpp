// bibdb/project/project_config.hpp - Project configuration (bibdb.yaml)
//
// Describes which .bib files make up a database and how to parse them.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bibdb/syntax/macro_table.hpp"

namespace bibdb
{

/// `parser:` section
struct ParserConfig
{
  /// full | abbrv | none
  syntax::MonthStyle month_style = syntax::MonthStyle::Full;
};

/**
 * Contents of a bibdb.yaml: which .bib files make up the database, in which
 * order, and the macros to declare before reading any of them.
 */
struct ProjectConfig
{
  ParserConfig parser;

  /// As written in the file; relative paths are relative to project_root
  std::vector<std::filesystem::path> sources;

  /// Declared in file order, as if by Parser::string
  std::vector<std::pair<std::string, std::string>> macros;

  /// Directory holding bibdb.yaml
  std::filesystem::path project_root;

  /// `sources` with relative paths anchored at project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_sources() const;
};

struct ConfigLoadResult
{
  bool success = false;

  /// Meaningful only when success is true
  ProjectConfig config;

  /// What made loading fail: a missing file, bad YAML, or a bad value
  std::string error;
};

[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & path);

/**
 * Look for bibdb.yaml in `start` (or its directory, if `start` is a file)
 * and then in each parent up to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start);

inline constexpr const char * k_project_config_file_name = "bibdb.yaml";

}  // namespace bibdb
