// bibdb/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// fmt does the layout and rang the colors. rang manipulators write nothing
// when its control mode is Off, so the same code serves both modes.
//
#include "bibdb/basic/diagnostic_printer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace bibdb
{

/// One source line to show, with the marked columns
struct DiagnosticPrinter::Excerpt
{
  std::string_view file;
  LineColumn at;
  std::string_view line;
  uint32_t marks = 1;
};

DiagnosticPrinter::DiagnosticPrinter(
  std::ostream & out, const SourceRegistry & sources, bool use_color)
: out_(out), sources_(sources)
{
  rang::setControlMode(use_color ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  severity_ = diag.severity;
  const auto primary = excerpt(diag.span);
  std::optional<Excerpt> related;
  if (diag.related) {
    related = excerpt(diag.related->span);
  }

  uint32_t last_line = 0;
  if (primary) last_line = primary->at.line;
  if (related) last_line = std::max(last_line, related->at.line);
  gutter_ = std::to_string(last_line).size();

  const bool is_error = diag.severity == Severity::Error;
  out_ << rang::style::bold << (is_error ? rang::fg::red : rang::fg::yellow)
       << (is_error ? "error" : "warning") << rang::fg::reset << ": " << diag.message
       << rang::style::reset << '\n';

  if (primary) {
    print_excerpt(*primary, "-->", true, diag.label);
  }
  if (related) {
    print_excerpt(*related, ":::", false, diag.related->message);
  } else if (diag.related) {
    print_footnote("note", diag.related->message);
  }
  if (!diag.entry_key.empty()) {
    print_footnote("entry", diag.entry_key);
  }
  if (diag.help) {
    print_footnote("help", *diag.help);
  }
  out_ << '\n';
}

void DiagnosticPrinter::print_excerpt(
  const Excerpt & excerpt, std::string_view arrow, bool primary, std::string_view text)
{
  const std::string pad(gutter_, ' ');
  out_ << pad << rang::fg::blue << arrow << rang::fg::reset
       << fmt::format(" {}:{}:{}\n", excerpt.file, excerpt.at.line, excerpt.at.column);
  out_ << pad << rang::fg::blue << " |" << rang::fg::reset << '\n';

  // Columns count bytes, so a tab shown as one space keeps the marker aligned
  std::string shown(excerpt.line);
  std::replace(shown.begin(), shown.end(), '\t', ' ');
  out_ << rang::fg::blue << fmt::format("{:>{}} |", excerpt.at.line, gutter_) << rang::fg::reset
       << ' ' << shown << '\n';

  const rang::fg tone =
    !primary ? rang::fg::cyan : (severity_ == Severity::Error ? rang::fg::red : rang::fg::yellow);
  out_ << pad << rang::fg::blue << " |" << rang::fg::reset << ' '
       << std::string(excerpt.at.column - 1, ' ') << rang::style::bold << tone
       << std::string(excerpt.marks, primary ? '^' : '-');
  if (!text.empty()) {
    out_ << ' ' << text;
  }
  out_ << rang::style::reset << '\n';
}

void DiagnosticPrinter::print_footnote(std::string_view kind, std::string_view text)
{
  out_ << std::string(gutter_, ' ') << rang::fg::blue << " = " << rang::fg::reset
       << rang::style::bold << kind << ':' << rang::style::reset << ' ' << text << '\n';
}

std::optional<DiagnosticPrinter::Excerpt> DiagnosticPrinter::excerpt(SourceSpan span) const
{
  const SourceFile * file = sources_.file(span.begin.file_id());
  if (file == nullptr) {
    return std::nullopt;
  }
  Excerpt e;
  e.file = file->name();
  e.at = file->line_column(span.begin.offset());
  e.line = file->line(e.at.line);

  // At least one marker, even for a point or a position past the line end
  const auto line_size = static_cast<uint32_t>(e.line.size());
  const uint32_t room = line_size >= e.at.column ? line_size - e.at.column + 1 : 1;
  e.marks = std::clamp<uint32_t>(span.length, 1, room);
  return e;
}

}  // namespace bibdb
