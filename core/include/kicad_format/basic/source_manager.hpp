// kicad_format/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking locations inside KiCad source files
// and a registry that owns the text of every file loaded by a tool.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kicad_format
{

// ============================================================================
// FileId - Compact handle to a registered source file
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset inside one file. Line and column information is computed on
 * demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open byte range [begin, end) inside one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - begin_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - One loaded file
// ============================================================================

/**
 * The text of one KiCad file plus a table of line starts, so diagnostics can
 * turn byte offsets into line/column pairs.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Text of a 0-indexed line without its terminator
  [[nodiscard]] std::string_view line(uint32_t line_index) const noexcept;

  [[nodiscard]] FullSourceRange full_range(SourceRange range) const noexcept;

private:
  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceRegistry - Owns every file a tool has loaded
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Take ownership of a file's text. Returns FileId::invalid() when full.
  FileId add(std::filesystem::path path, std::string content);

  [[nodiscard]] const SourceFile * file(FileId id) const noexcept;
  [[nodiscard]] std::string path_string(FileId id) const;
  [[nodiscard]] FullSourceRange full_range(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
};

}  // namespace kicad_format
