// bibdb/syntax/parser.cpp - Recursive-descent .bib parser
//
// Productions mirror get_bib_command_or_entry_and_process and friends in
// bibtex.web. The one liberty taken is that white space is skipped after
// every token instead of explicitly between tokens; the result is the same.
//
#include "bibdb/syntax/parser.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "bibdb/basic/diagnostic_printer.hpp"
#include "bibdb/basic/text.hpp"

namespace bibdb::syntax
{
namespace
{

/// Collapse space/tab/newline runs to one space, then strip literal spaces
/// from both ends (see check_for_and_compress_bib_white_space)
std::string compress_white_space(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  bool in_space = false;
  for (const char c : raw) {
    if (is_bib_space(c)) {
      if (!in_space) {
        out.push_back(' ');
      }
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(c);
  }

  const size_t first = out.find_first_not_of(' ');
  if (first == std::string::npos) {
    return {};
  }
  const size_t last = out.find_last_not_of(' ');
  return out.substr(first, last - first + 1);
}

}  // namespace

std::string strip_trailing_line_space(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  size_t line_start = 0;
  while (line_start <= text.size()) {
    size_t nl = text.find('\n', line_start);
    const bool last_line = (nl == std::string_view::npos);
    if (last_line) {
      nl = text.size();
    }
    std::string_view line = text.substr(line_start, nl - line_start);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
      line.remove_suffix(1);
    }
    out.append(line);
    if (last_line) {
      break;
    }
    out.push_back('\n');
    line_start = nl + 1;
  }
  return out;
}

Parser::Parser(ParserOptions options) : options_(options), macros_(options.month_style) {}

void Parser::string(std::string_view name, std::string value)
{
  macros_.define(name, std::move(value));
}

// ============================================================================
// Session
// ============================================================================

ParseResult Parser::parse(std::string text, std::string name)
{
  ParseResult result;

  if (finalized_) {
    emit(result.diagnostics.error({}, "cannot parse `" + name + "' after finalize"));
    return result;
  }

  std::string stripped = strip_trailing_line_space(text);
  if (stripped.size() > UINT32_MAX) {
    emit(result.diagnostics.error({}, "source text `" + name + "' is too large"));
    return result;
  }
  file_id_ = sources_.add(std::move(name), std::move(stripped));
  if (!file_id_.is_valid()) {
    emit(result.diagnostics.error({}, "too many source files in one parser session"));
    return result;
  }

  scanner_.emplace(sources_.file(file_id_)->text());
  errors_.clear();

  // A failed construct leaves the cursor where the error was found; the
  // next iteration resumes at the following '@'.
  while (!scanner_->eof()) {
    scan_command_or_entry();
  }

  scanner_.reset();
  result.file_id = file_id_;
  result.diagnostics = std::move(errors_);
  errors_.clear();
  result.success = !result.diagnostics.has_errors();
  return result;
}

ParseResult Parser::parse_file(const std::filesystem::path & path, std::optional<std::string> name)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ParseResult result;
    emit(result.diagnostics.error({}, "cannot open file: " + path.string()));
    return result;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str(), name ? std::move(*name) : path.string());
}

FinalizeResult Parser::finalize()
{
  FinalizeResult result;

  if (finalized_) {
    emit(result.diagnostics.error({}, "database already finalized"));
    return result;
  }

  // Crossref targets may be defined after the entries that use them, so
  // they can only be checked once every input has been parsed.
  for (const auto & entry : entries_) {
    const auto * crossref = entry->find("crossref");
    if (crossref == nullptr || entries_.contains(*crossref)) {
      continue;
    }
    emit(result.diagnostics.error(SourceSpan{entry->pos()}, "unknown crossref `" + *crossref + "'")
           .set_related(SourceSpan{entry->field_pos("crossref")}, "referenced here")
           .set_entry(entry->key()));
  }

  finalized_ = true;
  result.database = std::exchange(entries_, Database{});
  result.success = !result.diagnostics.has_errors();
  return result;
}

// ============================================================================
// Diagnostics
// ============================================================================

void Parser::error_at(uint32_t offset, std::string message)
{
  emit(errors_.error(SourceSpan{loc(offset)}, std::move(message)));
}

void Parser::warn_at(SourceSpan at, std::string message, std::string help)
{
  Diagnostic & warning = log_.warning(at, std::move(message));
  if (!help.empty()) {
    warning.set_help(std::move(help));
  }
  emit(warning);
}

void Parser::emit(const Diagnostic & diag)
{
  if (options_.log_stream == nullptr) {
    return;
  }
  DiagnosticPrinter(*options_.log_stream, sources_, options_.use_color).print(diag);
}

// ============================================================================
// Productions
// ============================================================================

bool Parser::expect(char c, std::string_view what)
{
  if (scanner_->try_char(c)) {
    return true;
  }
  error_at(scanner_->offset(), std::string(what));
  return false;
}

std::optional<std::string_view> Parser::scan_identifier()
{
  if (auto id = scanner_->try_identifier()) {
    return id;
  }
  error_at(scanner_->offset(), "expected identifier");
  return std::nullopt;
}

void Parser::scan_command_or_entry()
{
  Scanner & s = *scanner_;

  // Skip to the next database entry or command
  s.skip_to_at();
  const uint32_t at_offset = s.offset();
  if (!s.try_char('@')) {
    return;
  }

  const auto type_tok = scan_identifier();
  if (!type_tok) {
    return;
  }
  std::string type = to_lower_ascii(*type_tok);

  // BibTeX does nothing with what follows @comment; its body is skipped as
  // inter-entry noise by the next skip_to_at().
  if (type == "comment") {
    return;
  }

  const auto left = s.try_open_delimiter();
  if (!left) {
    error_at(s.offset(), "expected { or ( after entry type");
    return;
  }
  const char left_char = left->front();
  const char right = (left_char == '(') ? ')' : '}';

  if (type == "preamble") {
    scan_preamble(right);
  } else if (type == "string") {
    scan_string(right);
  } else {
    scan_entry(std::move(type), left_char, at_offset);
  }
}

void Parser::scan_preamble(char right)
{
  // Parsed for its diagnostics only
  if (!scan_field_value()) {
    return;
  }
  expect(right, std::string("expected ") + right);
}

void Parser::scan_string(char right)
{
  const uint32_t name_offset = scanner_->offset();
  const auto name = scan_identifier();
  if (!name) {
    return;
  }
  std::string macro = to_lower_ascii(*name);
  if (macros_.contains(macro)) {
    warn_at(span(name_offset, name->size()), "macro `" + macro + "' redefined");
  }

  if (!expect('=', "expected = after string name")) {
    return;
  }
  auto value = scan_field_value();
  if (!value) {
    return;
  }
  if (!expect(right, std::string("expected ") + right)) {
    return;
  }
  macros_.define(macro, std::move(*value));
}

void Parser::scan_entry(std::string type, char left, uint32_t at_offset)
{
  Scanner & s = *scanner_;

  // The key runs up to a comma, white space or end of line; it may be empty.
  // Inside parentheses it may even contain ')'.
  const uint32_t key_offset = s.offset();
  const std::string key(s.scan_key(left == '(' ? '\0' : '}'));

  auto entry = std::make_shared<Entry>(std::move(type), key, loc(at_offset));

  const char right = (left == '(') ? ')' : '}';
  const std::string right_or_comma = std::string("expected ") + right + " or ,";
  while (true) {
    if (s.try_char(right)) {
      break;
    }
    if (!expect(',', right_or_comma)) {
      return;
    }
    // Trailing comma before the closing delimiter
    if (s.try_char(right)) {
      break;
    }

    const uint32_t field_offset = s.offset();
    const auto field = scan_identifier();
    if (!field) {
      return;
    }
    const std::string name = to_lower_ascii(*field);
    if (!expect('=', "expected = after field name")) {
      return;
    }
    auto value = scan_field_value();
    if (!value) {
      return;
    }
    entry->set(name, std::move(*value), loc(field_offset));
  }

  if (const auto first = entries_.find(key)) {
    emit(errors_.error(span(key_offset, key.size()), "repeated entry")
           .set_label("`" + key + "' already defined")
           .set_related(SourceSpan{first->pos()}, "first defined here")
           .set_entry(key));
    return;
  }
  entries_.insert(std::move(entry));
}

std::optional<std::string> Parser::scan_field_value()
{
  auto value = scan_field_piece();
  if (!value) {
    return std::nullopt;
  }
  while (scanner_->try_char('#')) {
    const auto piece = scan_field_piece();
    if (!piece) {
      return std::nullopt;
    }
    *value += *piece;
  }
  return compress_white_space(*value);
}

std::optional<std::string> Parser::scan_field_piece()
{
  Scanner & s = *scanner_;

  if (const auto digits = s.try_digits()) {
    return std::string(*digits);
  }
  if (s.try_char('{', false)) {
    return scan_balanced_text('}');
  }
  if (s.try_char('"', false)) {
    return scan_balanced_text('"');
  }

  const uint32_t id_offset = s.offset();
  if (const auto id = s.try_identifier()) {
    if (const auto * value = macros_.find(*id)) {
      return *value;
    }
    warn_at(
      span(id_offset, id->size()), "unknown macro `" + std::string(*id) + "'",
      "define it with @string{" + to_lower_ascii(*id) + " = \"...\"} before use");
    return std::string();
  }

  error_at(s.offset(), "expected string, number, or macro name");
  return std::nullopt;
}

std::optional<std::string> Parser::scan_balanced_text(char term)
{
  const BalancedText scanned = scanner_->scan_balanced_text(term);
  switch (scanned.status) {
    case BalanceStatus::Ok:
      return std::string(scanned.text);
    case BalanceStatus::UnexpectedClose:
      error_at(scanner_->offset(), "unexpected }");
      return std::nullopt;
    case BalanceStatus::Unterminated:
      error_at(scanner_->offset(), "unterminated string");
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace bibdb::syntax
