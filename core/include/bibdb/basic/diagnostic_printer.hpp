// bibdb/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/basic/source_manager.hpp"

namespace bibdb
{

/**
 * Prints diagnostics with the offending source line, e.g.
 *
 *   error: repeated entry
 *    --> refs.bib:9:7
 *     |
 *   9 | @book{Knuth84,
 *     |       ^^^^^^^ `Knuth84' already defined
 *    ::: refs.bib:2:1
 *     |
 *   2 | @article{knuth84,
 *     | - first defined here
 *     = entry: Knuth84
 *
 * Diagnostics without a known position print only their message and the
 * `=` lines. Colors go through rang and are off unless requested.
 */
class DiagnosticPrinter
{
public:
  DiagnosticPrinter(std::ostream & out, const SourceRegistry & sources, bool use_color = false);

  void print(const Diagnostic & diag);

private:
  struct Excerpt;

  [[nodiscard]] std::optional<Excerpt> excerpt(SourceSpan span) const;
  void print_excerpt(const Excerpt & excerpt, std::string_view arrow, bool primary,
                     std::string_view text);
  void print_footnote(std::string_view kind, std::string_view text);

  std::ostream & out_;
  const SourceRegistry & sources_;

  // Set per print() call
  Severity severity_ = Severity::Error;
  size_t gutter_ = 1;
};

}  // namespace bibdb
