// bibdb/model/database.cpp - Database and crossref merging
#include "bibdb/model/database.hpp"

#include <stdexcept>

#include "bibdb/basic/text.hpp"

namespace bibdb
{

bool Database::insert(EntryPtr entry)
{
  std::string key = to_lower_ascii(entry->key());
  if (index_.count(key) != 0) {
    return false;
  }
  index_.emplace(std::move(key), entries_.size());
  entries_.push_back(std::move(entry));
  return true;
}

EntryPtr Database::find(std::string_view key) const
{
  const auto it = index_.find(to_lower_ascii(key));
  if (it == index_.end()) {
    return nullptr;
  }
  return entries_[it->second];
}

const EntryPtr & Database::at(std::string_view key) const
{
  const auto it = index_.find(to_lower_ascii(key));
  if (it == index_.end()) {
    throw std::out_of_range("no entry with key `" + std::string(key) + "'");
  }
  return entries_[it->second];
}

std::vector<std::string> Database::keys() const
{
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto & e : entries_) {
    out.push_back(to_lower_ascii(e->key()));
  }
  return out;
}

bool Database::operator==(const Database & other) const
{
  if (entries_.size() != other.entries_.size()) {
    return false;
  }
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (to_lower_ascii(entries_[i]->key()) != to_lower_ascii(other.entries_[i]->key())) {
      return false;
    }
    if (*entries_[i] != *other.entries_[i]) {
      return false;
    }
  }
  return true;
}

EntryPtr resolve_crossref(const EntryPtr & entry, const Database & db)
{
  const auto * crossref = entry->find("crossref");
  if (crossref == nullptr) {
    return entry;
  }

  const EntryPtr & source = db.at(*crossref);

  auto merged = std::make_shared<Entry>(*entry);
  for (const auto & f : *source) {
    if (!merged->contains(f.name)) {
      merged->set(f.name, f.value, source->field_pos(f.name));
    }
  }
  merged->erase("crossref");
  return merged;
}

}  // namespace bibdb
