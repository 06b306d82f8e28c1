// bibdb/basic/diagnostic.cpp - DiagnosticBag
#include "bibdb/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>

namespace bibdb
{

Diagnostic & DiagnosticBag::add(Severity severity, SourceSpan span, std::string message)
{
  Diagnostic & d = items_.emplace_back();
  d.severity = severity;
  d.span = span;
  d.message = std::move(message);
  return d;
}

Diagnostic & DiagnosticBag::error(SourceSpan span, std::string message)
{
  return add(Severity::Error, span, std::move(message));
}

Diagnostic & DiagnosticBag::warning(SourceSpan span, std::string message)
{
  return add(Severity::Warning, span, std::move(message));
}

void DiagnosticBag::append(DiagnosticBag && other)
{
  if (items_.empty()) {
    items_ = std::move(other.items_);
  } else {
    std::move(other.items_.begin(), other.items_.end(), std::back_inserter(items_));
  }
  other.items_.clear();
}

size_t DiagnosticBag::count(Severity severity) const noexcept
{
  return static_cast<size_t>(std::count_if(
    items_.begin(), items_.end(), [severity](const Diagnostic & d) { return d.severity == severity; }));
}

}  // namespace bibdb
