// bibdb/model/entry.hpp - One database entry (@article{key, ...})
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bibdb/basic/diagnostic.hpp"
#include "bibdb/basic/source_manager.hpp"

namespace bibdb
{

struct Field
{
  std::string name;   ///< lower-cased
  std::string value;  ///< white space already normalized

  [[nodiscard]] bool operator==(const Field & other) const
  {
    return name == other.name && value == other.value;
  }
};

/**
 * Chronological sort key: (), (year) or (year, month).
 *
 * Compares like a tuple, so an entry without a date sorts before any dated
 * entry and a year alone sorts before the same year with a month.
 */
struct DateKey
{
  std::optional<std::int64_t> year;
  std::optional<int> month;

  [[nodiscard]] bool empty() const noexcept { return !year; }

  [[nodiscard]] bool operator==(const DateKey & other) const
  {
    return year == other.year && month == other.month;
  }
  [[nodiscard]] bool operator!=(const DateKey & other) const { return !(*this == other); }
  [[nodiscard]] bool operator<(const DateKey & other) const
  {
    if (year != other.year) return year < other.year;
    return month < other.month;
  }
};

/**
 * An entry in a BibTeX database.
 *
 * An ordered list of fields plus the entry type (lower-cased), the database
 * key (case preserved, but compared case-insensitively by Database) and the
 * source locations of the entry and of each field name.
 *
 * Field values are what a .bst file would see: white space is cleaned up but
 * macros are expanded and TeX markup is kept verbatim.
 */
class Entry
{
public:
  Entry() = default;
  Entry(std::string type, std::string key, SourceLocation pos = {})
  : type_(std::move(type)), key_(std::move(key)), pos_(pos)
  {
  }

  [[nodiscard]] const std::string & type() const noexcept { return type_; }
  [[nodiscard]] const std::string & key() const noexcept { return key_; }
  [[nodiscard]] SourceLocation pos() const noexcept { return pos_; }

  // ===========================================================================
  // Fields
  // ===========================================================================

  /**
   * Set a field. A name that is already present keeps its slot in the field
   * order and takes the new value and position.
   */
  void set(std::string_view name, std::string value, SourceLocation name_pos = {});

  /// Remove a field; returns false if it was absent
  bool erase(std::string_view name);

  [[nodiscard]] const std::string * find(std::string_view name) const noexcept;

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept
  {
    if (const auto * v = find(name)) return std::string_view(*v);
    return std::nullopt;
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept
  {
    return find(name) != nullptr;
  }

  /**
   * Look up a field that must be present.
   *
   * Reports "missing field" naming this entry into `diags` and returns
   * nullptr when the field is absent.
   */
  const std::string * require(std::string_view name, DiagnosticBag & diags) const;

  /// Location of a field's name token; invalid if unknown
  [[nodiscard]] SourceLocation field_pos(std::string_view name) const;

  [[nodiscard]] const std::vector<Field> & fields() const noexcept { return fields_; }
  [[nodiscard]] size_t size() const noexcept { return fields_.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
  [[nodiscard]] auto begin() const { return fields_.begin(); }
  [[nodiscard]] auto end() const { return fields_.end(); }

  // ===========================================================================
  // Dates
  // ===========================================================================

  /**
   * Sort key for ordering entries by date.
   *
   * Reports into `diags` and returns std::nullopt when the year is not all
   * digits, when a month is given without a year, or when the month cannot
   * be parsed. Years must fit in 64 bits; a longer digit string is reported
   * as out of range.
   */
  [[nodiscard]] std::optional<DateKey> date_key(DiagnosticBag & diags) const;

  /**
   * Convert a month field into a number in [1, 12].
   *
   * Accepts any prefix of at least three letters of a full month name, case-
   * insensitively and with an optional trailing '.', so "Jan", "jan.",
   * "Sept." and "JANUARY" all work.
   */
  [[nodiscard]] std::optional<int> month_num(
    DiagnosticBag & diags, std::string_view field = "month") const;

  /// Equal iff fields (in order), type and key are equal
  [[nodiscard]] bool operator==(const Entry & other) const
  {
    return fields_ == other.fields_ && type_ == other.type_ && key_ == other.key_;
  }
  [[nodiscard]] bool operator!=(const Entry & other) const { return !(*this == other); }

private:
  std::string type_;
  std::string key_;
  SourceLocation pos_;
  std::vector<Field> fields_;
  std::unordered_map<std::string, SourceLocation> field_pos_;
};

}  // namespace bibdb
