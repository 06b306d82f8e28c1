// bibdb/syntax/parser.hpp - Parser for .bib BibTeX database files
//
// The grammar follows the "Reading the database file(s)" part of bibtex.web,
// so any .bib file that BibTeX accepts parses to the same field values here.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/basic/source_manager.hpp"
#include "bibdb/model/database.hpp"
#include "bibdb/syntax/macro_table.hpp"
#include "bibdb/syntax/scanner.hpp"

namespace bibdb::syntax
{

struct ParserOptions
{
  /// Which month macros to pre-define
  MonthStyle month_style = MonthStyle::Full;

  /// When set, every warning and error is printed here as it is reported
  std::ostream * log_stream = nullptr;

  /// Terminal colors for log_stream output
  bool use_color = false;
};

/**
 * Outcome of one parse() call. The database keeps every construct that
 * parsed, whether or not others in the same text failed.
 */
struct ParseResult
{
  /// Whether the text parsed without errors
  bool success = false;

  /// Errors only; warnings go to Parser::log()
  DiagnosticBag diagnostics;

  /// Registry id of the parsed text
  FileId file_id = FileId::invalid();
};

struct FinalizeResult
{
  /// Whether all cross-references resolved
  bool success = false;

  DiagnosticBag diagnostics;

  /// The complete database, also when success is false
  Database database;
};

/**
 * A .bib parsing session.
 *
 * Call parse() once per input, in order; later inputs see the macros and
 * entries of earlier ones. finalize() then checks cross-references across
 * everything parsed and hands out the database. The parser keeps the source
 * texts alive so that entry positions stay resolvable through sources().
 *
 * Positions are 32-bit byte offsets, so a single text may not exceed 4 GiB;
 * parse() rejects larger texts. One session holds up to UINT32_MAX - 1 texts.
 */
class Parser
{
public:
  explicit Parser(ParserOptions options = {});

  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;

  /// Declare a macro, just like an @string command (no redefinition warning)
  void string(std::string_view name, std::string value);

  /**
   * Parse one text and add its macros and entries to this session.
   *
   * @param text .bib source
   * @param name Name used in diagnostics
   */
  [[nodiscard]] ParseResult parse(std::string text, std::string name = "<string>");

  /// Read a file and parse it; `name` defaults to the path
  [[nodiscard]] ParseResult parse_file(
    const std::filesystem::path & path, std::optional<std::string> name = std::nullopt);

  /**
   * Check cross-references and return the database. Seals the session:
   * later parse() or finalize() calls fail without touching anything.
   */
  [[nodiscard]] FinalizeResult finalize();

  [[nodiscard]] const MacroTable & macros() const noexcept { return macros_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

  /// Entries parsed so far (empty after finalize)
  [[nodiscard]] const Database & database() const noexcept { return entries_; }

  /// Every warning reported by this session
  [[nodiscard]] const DiagnosticBag & log() const noexcept { return log_; }

  [[nodiscard]] bool finalized() const noexcept { return finalized_; }

private:
  // Productions. A reported error abandons the current command or entry;
  // value productions signal it by returning std::nullopt.
  void scan_command_or_entry();
  void scan_preamble(char right);
  void scan_string(char right);
  void scan_entry(std::string type, char left, uint32_t at_offset);
  [[nodiscard]] std::optional<std::string> scan_field_value();
  [[nodiscard]] std::optional<std::string> scan_field_piece();
  [[nodiscard]] std::optional<std::string> scan_balanced_text(char term);
  [[nodiscard]] std::optional<std::string_view> scan_identifier();

  /// Required token: match `c` or report `what` as an error
  bool expect(char c, std::string_view what);

  // Diagnostics at an offset of the text being parsed
  [[nodiscard]] SourceLocation loc(uint32_t offset) const noexcept { return {file_id_, offset}; }
  [[nodiscard]] SourceSpan span(uint32_t offset, size_t length) const noexcept
  {
    return {loc(offset), static_cast<uint32_t>(length)};
  }
  void error_at(uint32_t offset, std::string message);
  void warn_at(SourceSpan at, std::string message, std::string help = "");
  void emit(const Diagnostic & diag);

  ParserOptions options_;
  MacroTable macros_;
  SourceRegistry sources_;
  Database entries_;
  DiagnosticBag log_;
  bool finalized_ = false;

  // State of the parse() call in progress
  FileId file_id_ = FileId::invalid();
  std::optional<Scanner> scanner_;
  DiagnosticBag errors_;
};

/// Remove trailing space/tab runs from every line (see input_ln in bibtex.web)
[[nodiscard]] std::string strip_trailing_line_space(std::string_view text);

}  // namespace bibdb::syntax
