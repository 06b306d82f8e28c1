// bibdb/basic/source_manager.hpp - Registered .bib texts and positions inside them
//
// A Parser registers every text it reads here, so entry and diagnostic
// positions can still be turned into file:line:column after parsing.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bibdb
{

/// Index of a text in a SourceRegistry
struct FileId
{
  uint32_t value = UINT32_MAX;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return {}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != UINT32_MAX; }

  bool operator==(const FileId &) const = default;
};

/**
 * Byte offset into one registered text.
 *
 * A default-constructed location is unknown: fields set by hand and
 * file-level errors (an unreadable path) have no position.
 */
class SourceLocation
{
public:
  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return file_.is_valid(); }

  bool operator==(const SourceLocation &) const = default;

private:
  FileId file_;
  uint32_t offset_ = 0;
};

/// `length` bytes starting at `begin`; a zero length marks a single point
struct SourceSpan
{
  SourceLocation begin;
  uint32_t length = 0;

  bool operator==(const SourceSpan &) const = default;
};

/// 1-based line and column; {0, 0} when a location cannot be resolved
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;
};

class SourceFile
{
public:
  SourceFile(std::string name, std::string text);

  /// "<string>" or the path a file was read from
  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }

  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Text of a 1-based line without its newline; empty past the last line
  [[nodiscard]] std::string_view line(uint32_t number) const noexcept;

private:
  std::string name_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

/**
 * Owner of the texts read by one parser session.
 *
 * Every add() creates a new id, also for a name seen before: two parse()
 * calls on "<string>" are two texts. SourceFile addresses never change.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;
  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;

  /// FileId::invalid() once UINT32_MAX texts have been added
  [[nodiscard]] FileId add(std::string name, std::string text);

  [[nodiscard]] const SourceFile * file(FileId id) const noexcept;

  /// "<unknown>" for ids this registry did not hand out
  [[nodiscard]] std::string_view name(FileId id) const noexcept;

  [[nodiscard]] LineColumn line_column(SourceLocation loc) const noexcept;

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
};

}  // namespace bibdb
