// bibdb/model/database.hpp - Ordered, case-insensitively keyed entry collection
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bibdb/model/entry.hpp"

namespace bibdb
{

using EntryPtr = std::shared_ptr<const Entry>;

/**
 * Entries in source order, keyed by lower-cased database key.
 *
 * Entries are immutable once inserted; operations that derive new entries
 * (resolve_crossref) return fresh objects.
 */
class Database
{
public:
  /// Insert under the lower-cased key. Returns false and leaves the database
  /// unchanged if that key is already present.
  bool insert(EntryPtr entry);

  /// Case-insensitive lookup; nullptr if absent
  [[nodiscard]] EntryPtr find(std::string_view key) const;

  /// Case-insensitive lookup; throws std::out_of_range if absent
  [[nodiscard]] const EntryPtr & at(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

  /// Lower-cased keys in insertion order
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

  /// Equal iff both hold equal entries under the same keys in the same order
  [[nodiscard]] bool operator==(const Database & other) const;
  [[nodiscard]] bool operator!=(const Database & other) const { return !(*this == other); }

private:
  std::vector<EntryPtr> entries_;
  std::unordered_map<std::string, size_t> index_;
};

/**
 * Return `entry` with the fields of its crossref-ed entry incorporated.
 *
 * Without a `crossref` field the same pointer is returned. Otherwise a new
 * entry holds all of `entry`'s fields, then every field of the target that
 * `entry` lacks (with the target's field position), and no `crossref` field.
 * Neither input is modified.
 *
 * The target must exist in `db` (Parser::finalize checks this); a missing
 * target throws std::out_of_range.
 */
[[nodiscard]] EntryPtr resolve_crossref(const EntryPtr & entry, const Database & db);

}  // namespace bibdb
