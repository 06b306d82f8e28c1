// bibdb/syntax/macro_table.cpp - Macro table with month seeding
#include "bibdb/syntax/macro_table.hpp"

#include <array>
#include <utility>

#include "bibdb/basic/text.hpp"

namespace bibdb::syntax
{
namespace
{

constexpr std::array<std::string_view, 12> k_month_macros = {
  "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 12> k_full_names = {
  "January", "February", "March",     "April",   "May",      "June",
  "July",    "August",   "September", "October", "November", "December"};

// abbrv.bst spells out the short months and uses "Sept."
constexpr std::array<std::string_view, 12> k_abbrv_names = {
  "Jan.", "Feb.", "Mar.",  "Apr.", "May",  "June",
  "July", "Aug.", "Sept.", "Oct.", "Nov.", "Dec."};

}  // namespace

std::optional<MonthStyle> parse_month_style(std::string_view text) noexcept
{
  if (text == "full") return MonthStyle::Full;
  if (text == "abbrv") return MonthStyle::Abbrv;
  if (text == "none") return MonthStyle::None;
  return std::nullopt;
}

std::string_view to_string(MonthStyle style) noexcept
{
  switch (style) {
    case MonthStyle::Full:
      return "full";
    case MonthStyle::Abbrv:
      return "abbrv";
    case MonthStyle::None:
      return "none";
  }
  return "none";
}

MacroTable::MacroTable(MonthStyle month_style)
{
  if (month_style == MonthStyle::None) {
    return;
  }
  const auto & names = (month_style == MonthStyle::Full) ? k_full_names : k_abbrv_names;
  for (size_t i = 0; i < k_month_macros.size(); ++i) {
    macros_.emplace(std::string(k_month_macros[i]), std::string(names[i]));
  }
}

bool MacroTable::define(std::string_view name, std::string value)
{
  return !macros_.insert_or_assign(to_lower_ascii(name), std::move(value)).second;
}

const std::string * MacroTable::find(std::string_view name) const
{
  const auto it = macros_.find(to_lower_ascii(name));
  return it == macros_.end() ? nullptr : &it->second;
}

}  // namespace bibdb::syntax
