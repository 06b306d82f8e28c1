// bibdb/test_support/parse_helpers.hpp - helpers for unit tests
//
// Parses one text with a fresh Parser and finalizes it. The parser stays
// alive in the unit so that positions and the warning log can be inspected.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/basic/source_manager.hpp"
#include "bibdb/model/database.hpp"
#include "bibdb/syntax/parser.hpp"

namespace bibdb::test_support
{

struct TestParseUnit
{
  std::unique_ptr<syntax::Parser> parser;
  DiagnosticBag parse_errors;
  DiagnosticBag finalize_errors;
  Database db;

  [[nodiscard]] const DiagnosticBag & warnings() const noexcept { return parser->log(); }

  [[nodiscard]] const SourceRegistry & sources() const noexcept { return parser->sources(); }

  [[nodiscard]] bool has_errors() const
  {
    return parse_errors.has_errors() || finalize_errors.has_errors();
  }

  [[nodiscard]] LineColumn line_column(SourceLocation loc) const noexcept
  {
    return sources().line_column(loc);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, syntax::MonthStyle month_style = syntax::MonthStyle::Full)
{
  TestParseUnit out;
  syntax::ParserOptions options;
  options.month_style = month_style;
  out.parser = std::make_unique<syntax::Parser>(options);

  syntax::ParseResult parsed = out.parser->parse(std::move(src), "<test>.bib");
  out.parse_errors = std::move(parsed.diagnostics);

  syntax::FinalizeResult finalized = out.parser->finalize();
  out.finalize_errors = std::move(finalized.diagnostics);
  out.db = std::move(finalized.database);
  return out;
}

/// True if any diagnostic in `bag` contains `needle` in its message
[[nodiscard]] inline bool has_message(const DiagnosticBag & bag, const std::string & needle)
{
  for (const auto & d : bag) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace bibdb::test_support
