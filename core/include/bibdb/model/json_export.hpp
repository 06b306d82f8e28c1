// bibdb/model/json_export.hpp - JSON serialization for entries and databases
//
// Returns nlohmann::json objects for downstream tools (formatters, name
// parsers, indexers) that consume parsed databases.
//
#pragma once

#include <nlohmann/json.hpp>

#include "bibdb/basic/source_manager.hpp"
#include "bibdb/model/database.hpp"
#include "bibdb/model/entry.hpp"

namespace bibdb
{

/**
 * Serialize an entry.
 *
 * Produces {"type", "key", "fields": [[name, value], ...], "pos"} with fields
 * kept in order. When `sources` is given, positions are {file, line, column};
 * otherwise {file_id, offset}.
 *
 * @param entry Entry to serialize
 * @param sources Registry that resolves the entry's positions (optional)
 */
[[nodiscard]] nlohmann::json to_json(const Entry & entry, const SourceRegistry * sources = nullptr);

/**
 * Serialize a database as an array of entries in source order.
 */
[[nodiscard]] nlohmann::json to_json(
  const Database & database, const SourceRegistry * sources = nullptr);

}  // namespace bibdb
