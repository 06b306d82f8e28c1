// bibdb/basic/diagnostic.hpp - Errors and warnings from parsing and record checks
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bibdb/basic/source_manager.hpp"

namespace bibdb
{

/**
 * Warnings never stop anything: a fallback value is used and reading goes
 * on. An error abandons the command, entry or record operation at hand.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/// Second position shown with a diagnostic, e.g. where a repeated key was
/// first defined
struct RelatedNote
{
  SourceSpan span;
  std::string message;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string message;

  /// Where the problem is; unknown for file-level errors
  SourceSpan span;

  /// Printed next to the marker under `span`
  std::string label;

  std::optional<RelatedNote> related;
  std::optional<std::string> help;

  /// Key of the entry the problem belongs to, if any
  std::string entry_key;

  Diagnostic & set_label(std::string text)
  {
    label = std::move(text);
    return *this;
  }

  Diagnostic & set_related(SourceSpan at, std::string text)
  {
    related = RelatedNote{at, std::move(text)};
    return *this;
  }

  Diagnostic & set_help(std::string text)
  {
    help = std::move(text);
    return *this;
  }

  Diagnostic & set_entry(std::string key)
  {
    entry_key = std::move(key);
    return *this;
  }
};

/**
 * Diagnostics in the order they were reported.
 *
 * error() and warning() return the new diagnostic for further decoration;
 * the reference is good until the next diagnostic is added.
 */
class DiagnosticBag
{
public:
  Diagnostic & error(SourceSpan span, std::string message);
  Diagnostic & warning(SourceSpan span, std::string message);

  /// Move all of `other`'s diagnostics to the end of this bag
  void append(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return items_; }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }
  void clear() noexcept { items_.clear(); }

  [[nodiscard]] size_t count(Severity severity) const noexcept;
  [[nodiscard]] bool has_errors() const noexcept { return count(Severity::Error) != 0; }

  [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
  [[nodiscard]] auto end() const noexcept { return items_.end(); }

private:
  Diagnostic & add(Severity severity, SourceSpan span, std::string message);

  std::vector<Diagnostic> items_;
};

}  // namespace bibdb
