// bibdb/basic/source_manager.cpp - Line tables and the text registry
#include "bibdb/basic/source_manager.hpp"

#include <algorithm>

namespace bibdb
{

SourceFile::SourceFile(std::string name, std::string text)
: name_(std::move(name)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (uint32_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));
  // Last line start at or before the offset; line_starts_[0] == 0 always matches
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  return {index + 1, offset - line_starts_[index] + 1};
}

std::string_view SourceFile::line(uint32_t number) const noexcept
{
  if (number == 0 || number > line_starts_.size()) {
    return {};
  }
  const uint32_t first = line_starts_[number - 1];
  const std::string_view rest = std::string_view(text_).substr(first);
  return rest.substr(0, rest.find('\n'));
}

FileId SourceRegistry::add(std::string name, std::string text)
{
  FileId id{static_cast<uint32_t>(files_.size())};
  if (!id.is_valid()) {
    return id;
  }
  files_.push_back(std::make_unique<SourceFile>(std::move(name), std::move(text)));
  return id;
}

const SourceFile * SourceRegistry::file(FileId id) const noexcept
{
  return id.value < files_.size() ? files_[id.value].get() : nullptr;
}

std::string_view SourceRegistry::name(FileId id) const noexcept
{
  const SourceFile * f = file(id);
  return f != nullptr ? std::string_view(f->name()) : "<unknown>";
}

LineColumn SourceRegistry::line_column(SourceLocation loc) const noexcept
{
  const SourceFile * f = file(loc.file_id());
  return f != nullptr ? f->line_column(loc.offset()) : LineColumn{};
}

}  // namespace bibdb
