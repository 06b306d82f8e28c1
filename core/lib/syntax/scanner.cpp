// bibdb/syntax/scanner.cpp - Character classes and scanning primitives
#include "bibdb/syntax/scanner.hpp"

namespace bibdb::syntax
{
namespace
{

bool is_digit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

bool is_id_char(char c) noexcept
{
  const auto u = static_cast<unsigned char>(c);
  if (u < 0x20 || u > 0x7F) {
    return false;
  }
  switch (c) {
    case ' ':
    case '\t':
    case '"':
    case '#':
    case '%':
    case '\'':
    case '(':
    case ')':
    case ',':
    case '=':
    case '{':
    case '}':
      return false;
    default:
      return true;
  }
}

void Scanner::skip_space() noexcept
{
  while (!eof() && is_bib_space(src_[pos_])) {
    ++pos_;
  }
}

void Scanner::skip_to_at() noexcept
{
  const size_t at = src_.find('@', pos_);
  pos_ = (at == std::string_view::npos) ? src_.size() : at;
}

std::string_view Scanner::take_from(size_t start, bool skip_space) noexcept
{
  const std::string_view text = src_.substr(start, pos_ - start);
  if (skip_space) {
    this->skip_space();
  }
  return text;
}

std::optional<std::string_view> Scanner::try_char(char c, bool skip_space) noexcept
{
  if (eof() || src_[pos_] != c) {
    return std::nullopt;
  }
  const size_t start = pos_++;
  return take_from(start, skip_space);
}

std::optional<std::string_view> Scanner::try_open_delimiter() noexcept
{
  if (auto t = try_char('{')) {
    return t;
  }
  return try_char('(');
}

std::optional<std::string_view> Scanner::try_digits() noexcept
{
  const size_t start = pos_;
  while (!eof() && is_digit(src_[pos_])) {
    ++pos_;
  }
  if (pos_ == start) {
    return std::nullopt;
  }
  return take_from(start, true);
}

std::optional<std::string_view> Scanner::try_identifier() noexcept
{
  if (eof() || is_digit(src_[pos_]) || !is_id_char(src_[pos_])) {
    return std::nullopt;
  }
  const size_t start = pos_;
  while (!eof() && is_id_char(src_[pos_])) {
    ++pos_;
  }
  return take_from(start, true);
}

std::string_view Scanner::scan_key(char extra_stop) noexcept
{
  const size_t start = pos_;
  while (!eof()) {
    const char c = src_[pos_];
    if (c == ',' || is_bib_space(c) || (extra_stop != '\0' && c == extra_stop)) {
      break;
    }
    ++pos_;
  }
  return take_from(start, true);
}

BalancedText Scanner::scan_balanced_text(char term) noexcept
{
  const size_t start = pos_;
  int level = 0;
  while (!eof()) {
    const char c = src_[pos_];
    if (level == 0 && c == term) {
      const std::string_view text = src_.substr(start, pos_ - start);
      ++pos_;
      skip_space();
      return {BalanceStatus::Ok, text};
    }
    if (c == '{') {
      ++level;
    } else if (c == '}') {
      if (--level < 0) {
        return {BalanceStatus::UnexpectedClose, {}};
      }
    }
    ++pos_;
  }
  return {BalanceStatus::Unterminated, {}};
}

}  // namespace bibdb::syntax
