// bibdb/model/entry.cpp - Entry fields and date parsing
#include "bibdb/model/entry.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>

#include "bibdb/basic/text.hpp"

namespace bibdb
{
namespace
{

constexpr std::array<std::string_view, 12> k_month_names = {
  "january", "february", "march",     "april",   "may",      "june",
  "july",    "august",   "september", "october", "november", "december"};

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

bool all_digits(std::string_view s)
{
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

void Entry::set(std::string_view name, std::string value, SourceLocation name_pos)
{
  auto it = std::find_if(
    fields_.begin(), fields_.end(), [&](const Field & f) { return f.name == name; });
  if (it != fields_.end()) {
    it->value = std::move(value);
  } else {
    fields_.push_back(Field{std::string(name), std::move(value)});
  }
  field_pos_[std::string(name)] = name_pos;
}

bool Entry::erase(std::string_view name)
{
  auto it = std::find_if(
    fields_.begin(), fields_.end(), [&](const Field & f) { return f.name == name; });
  if (it == fields_.end()) {
    return false;
  }
  fields_.erase(it);
  field_pos_.erase(std::string(name));
  return true;
}

const std::string * Entry::find(std::string_view name) const noexcept
{
  for (const auto & f : fields_) {
    if (f.name == name) {
      return &f.value;
    }
  }
  return nullptr;
}

const std::string * Entry::require(std::string_view name, DiagnosticBag & diags) const
{
  if (const auto * v = find(name)) {
    return v;
  }
  diags.error(SourceSpan{pos_}, "missing field `" + std::string(name) + "' in entry `" + key_ + "'")
    .set_label("entry defined here");
  return nullptr;
}

SourceLocation Entry::field_pos(std::string_view name) const
{
  const auto it = field_pos_.find(std::string(name));
  return it == field_pos_.end() ? SourceLocation{} : it->second;
}

std::optional<DateKey> Entry::date_key(DiagnosticBag & diags) const
{
  DateKey key;
  const auto * year = find("year");
  const auto * month = find("month");

  if (year != nullptr) {
    const SourceSpan at{field_pos("year"), 4};
    if (!all_digits(*year)) {
      diags.error(at, "invalid year `" + *year + "'").set_entry(key_);
      return std::nullopt;
    }
    // All digits, so the only possible failure is overflow
    std::int64_t value = 0;
    const auto parsed = std::from_chars(year->data(), year->data() + year->size(), value);
    if (parsed.ec != std::errc()) {
      diags.error(at, "year `" + *year + "' out of range").set_entry(key_);
      return std::nullopt;
    }
    key.year = value;
  }

  if (month != nullptr) {
    if (year == nullptr) {
      diags.error(SourceSpan{field_pos("month")}, "month without year").set_entry(key_);
      return std::nullopt;
    }
    const auto num = month_num(diags);
    if (!num) {
      return std::nullopt;
    }
    key.month = *num;
  }

  return key;
}

std::optional<int> Entry::month_num(DiagnosticBag & diags, std::string_view field) const
{
  const auto * raw = require(field, diags);
  if (raw == nullptr) {
    return std::nullopt;
  }

  std::string_view val = trim(*raw);
  if (!val.empty() && val.back() == '.') {
    val.remove_suffix(1);
  }
  const std::string needle = to_lower_ascii(val);

  if (needle.size() >= 3) {
    for (size_t i = 0; i < k_month_names.size(); ++i) {
      if (k_month_names[i].substr(0, needle.size()) == needle) {
        return static_cast<int>(i + 1);
      }
    }
  }

  diags.error(SourceSpan{field_pos(field)}, "invalid month `" + *raw + "'").set_entry(key_);
  return std::nullopt;
}

}  // namespace bibdb
