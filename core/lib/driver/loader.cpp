// bibdb/driver/loader.cpp - Database loading driver implementation
//
#include "bibdb/driver/loader.hpp"

#include <utility>

namespace bibdb
{

namespace
{

syntax::ParserOptions make_parser_options(syntax::MonthStyle style, const LoadOptions & options)
{
  syntax::ParserOptions out;
  out.month_style = style;
  out.log_stream = options.log_stream;
  out.use_color = options.use_color;
  return out;
}

}  // namespace

LoadResult DatabaseLoader::load_project(const ProjectConfig & config, const LoadOptions & options)
{
  auto parser =
    std::make_unique<syntax::Parser>(make_parser_options(config.parser.month_style, options));
  for (const auto & [name, value] : config.macros) {
    parser->string(name, value);
  }
  return run(std::move(parser), config.resolved_sources());
}

LoadResult DatabaseLoader::load_files(
  const std::vector<std::filesystem::path> & files, syntax::MonthStyle month_style,
  const LoadOptions & options)
{
  return run(std::make_unique<syntax::Parser>(make_parser_options(month_style, options)), files);
}

LoadResult DatabaseLoader::run(
  std::unique_ptr<syntax::Parser> parser, const std::vector<std::filesystem::path> & files)
{
  LoadResult result;

  for (const auto & file : files) {
    // Continue with later files so that all errors are collected
    syntax::ParseResult parsed = parser->parse_file(file);
    result.diagnostics.append(std::move(parsed.diagnostics));
  }

  syntax::FinalizeResult finalized = parser->finalize();
  result.diagnostics.append(std::move(finalized.diagnostics));
  result.database = std::move(finalized.database);
  result.parser = std::move(parser);
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace bibdb
