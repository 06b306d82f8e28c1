// bibdb/syntax/macro_table.hpp - @string macro definitions
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bibdb::syntax
{

/**
 * How month macros (jan, feb, ...) are pre-defined.
 *
 * These are normally provided by the style file; seeding them lets field
 * values such as `month = jan` expand without one.
 */
enum class MonthStyle : uint8_t {
  Full,   ///< jan -> "January"
  Abbrv,  ///< jan -> "Jan." (abbrv.bst convention)
  None,   ///< no month macros
};

/// Parse "full", "abbrv" or "none"
[[nodiscard]] std::optional<MonthStyle> parse_month_style(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(MonthStyle style) noexcept;

/**
 * Macro name -> replacement text. Names are case-insensitive and stored
 * lower-cased.
 */
class MacroTable
{
public:
  explicit MacroTable(MonthStyle month_style = MonthStyle::Full);

  /// Define or redefine a macro. Returns true if the name was already defined.
  bool define(std::string_view name, std::string value);

  [[nodiscard]] const std::string * find(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return macros_.size(); }

private:
  std::unordered_map<std::string, std::string> macros_;
};

}  // namespace bibdb::syntax
