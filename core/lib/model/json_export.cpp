// bibdb/model/json_export.cpp - JSON serialization implementation
//
#include "bibdb/model/json_export.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace bibdb
{
namespace
{

using nlohmann::json;

json j_pos(SourceLocation loc, const SourceRegistry * sources)
{
  if (!loc.is_valid()) {
    return nullptr;
  }
  if (sources == nullptr) {
    return json{{"file_id", loc.file_id().value}, {"offset", loc.offset()}};
  }
  const LineColumn lc = sources->line_column(loc);
  return json{
    {"file", std::string(sources->name(loc.file_id()))},
    {"line", lc.line},
    {"column", lc.column}};
}

}  // namespace

json to_json(const Entry & entry, const SourceRegistry * sources)
{
  json fields = json::array();
  json field_pos = json::object();
  for (const auto & f : entry) {
    fields.push_back(json::array({f.name, f.value}));
    field_pos[f.name] = j_pos(entry.field_pos(f.name), sources);
  }

  return json{
    {"type", entry.type()},
    {"key", entry.key()},
    {"fields", std::move(fields)},
    {"pos", j_pos(entry.pos(), sources)},
    {"field_pos", std::move(field_pos)}};
}

json to_json(const Database & database, const SourceRegistry * sources)
{
  json out = json::array();
  for (const auto & entry : database) {
    out.push_back(to_json(*entry, sources));
  }
  return out;
}

}  // namespace bibdb
