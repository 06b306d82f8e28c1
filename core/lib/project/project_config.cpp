// bibdb/project/project_config.cpp - Reading bibdb.yaml
#include "bibdb/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace bibdb
{

namespace fs = std::filesystem;

namespace
{

// Each reader fills its part of the config and returns an error message,
// or an empty string when the section is acceptable.

std::string read_parser(const YAML::Node & node, ParserConfig & parser)
{
  if (!node.IsMap()) {
    return "parser must be a map";
  }
  if (const YAML::Node style = node["month_style"]) {
    const auto text = style.as<std::string>();
    const auto parsed = syntax::parse_month_style(text);
    if (!parsed) {
      return "invalid parser.month_style: '" + text + "' (must be 'full', 'abbrv' or 'none')";
    }
    parser.month_style = *parsed;
  }
  return {};
}

std::string read_sources(const YAML::Node & node, std::vector<fs::path> & sources)
{
  if (!node.IsSequence()) {
    return "sources must be a list";
  }
  for (const auto & item : node) {
    sources.emplace_back(item.as<std::string>());
  }
  return {};
}

std::string read_macros(
  const YAML::Node & node, std::vector<std::pair<std::string, std::string>> & macros)
{
  if (!node.IsMap()) {
    return "macros must be a map of name to text";
  }
  for (const auto & kv : node) {
    macros.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
  }
  return {};
}

}  // namespace

std::vector<fs::path> ProjectConfig::resolved_sources() const
{
  std::vector<fs::path> out;
  out.reserve(sources.size());
  for (const auto & src : sources) {
    out.push_back(src.is_absolute() ? src : project_root / src);
  }
  return out;
}

ConfigLoadResult load_project_config(const fs::path & path)
{
  ConfigLoadResult result;
  if (!fs::exists(path)) {
    result.error = "configuration file not found: " + path.string();
    return result;
  }

  ProjectConfig & config = result.config;
  config.project_root = fs::absolute(path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(path.string());
    if (const YAML::Node n = root["parser"]) {
      result.error = read_parser(n, config.parser);
    }
    if (const YAML::Node n = root["sources"]; n && result.error.empty()) {
      result.error = read_sources(n, config.sources);
    }
    if (const YAML::Node n = root["macros"]; n && result.error.empty()) {
      result.error = read_macros(n, config.macros);
    }
  } catch (const YAML::Exception & e) {
    result.error = std::string("failed to parse YAML: ") + e.what();
  }

  result.success = result.error.empty();
  return result;
}

std::optional<fs::path> find_project_config(const fs::path & start)
{
  fs::path dir = fs::absolute(start);
  if (!fs::is_directory(dir)) {
    dir = dir.parent_path();
  }

  for (;;) {
    if (const fs::path candidate = dir / k_project_config_file_name; fs::is_regular_file(candidate)) {
      return candidate;
    }
    // The root is its own parent
    if (dir == dir.parent_path()) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

}  // namespace bibdb
