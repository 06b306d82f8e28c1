// bibdb/syntax/scanner.hpp - Cursor and token primitives for .bib text
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bibdb::syntax
{

/// BibTeX white space: only space, tab and newline (see lex_class in bibtex.web)
[[nodiscard]] constexpr bool is_bib_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n';
}

/// Printable ASCII that may appear in an identifier
[[nodiscard]] bool is_id_char(char c) noexcept;

/// Outcome of a brace-balanced scan
enum class BalanceStatus : uint8_t {
  Ok,
  UnexpectedClose,  ///< a '}' drove the nesting level below zero
  Unterminated,     ///< input ended before the terminator was found
};

struct BalancedText
{
  BalanceStatus status = BalanceStatus::Ok;
  std::string_view text;  ///< text before the terminator (Ok only)
};

/**
 * A cursor over one source text.
 *
 * Every try_* primitive either matches at the cursor, advances past the match
 * and (unless told otherwise) past any following white space, or leaves the
 * cursor untouched and returns std::nullopt. None of them report errors; the
 * parser decides what a failed match means.
 */
class Scanner
{
public:
  explicit Scanner(std::string_view src) : src_(src) {}

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }

  [[nodiscard]] uint32_t offset() const noexcept { return static_cast<uint32_t>(pos_); }

  [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : src_[pos_]; }

  void skip_space() noexcept;

  /// Skip everything up to the next '@' (or to the end of input)
  void skip_to_at() noexcept;

  /// Match a single character
  std::optional<std::string_view> try_char(char c, bool skip_space = true) noexcept;

  /// Match one of '{' or '('
  std::optional<std::string_view> try_open_delimiter() noexcept;

  /// Match a non-empty run of ASCII digits
  std::optional<std::string_view> try_digits() noexcept;

  /// Match an identifier: is_id_char() run whose first char is not a digit
  std::optional<std::string_view> try_identifier() noexcept;

  /// Match a (possibly empty) run of characters up to ',', white space, or
  /// `extra_stop` when it is non-zero. Always succeeds.
  std::string_view scan_key(char extra_stop) noexcept;

  /**
   * Scan brace-balanced text terminated by `term`.
   *
   * The cursor must sit just after the opening delimiter. On success the
   * cursor moves past the terminator and any following white space. On
   * failure it is left on the offending '}' or at end of input.
   */
  BalancedText scan_balanced_text(char term) noexcept;

private:
  std::string_view take_from(size_t start, bool skip_space) noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace bibdb::syntax
