// kicad_format/basic/source_manager.cpp - Source file and registry implementation
#include "kicad_format/basic/source_manager.hpp"

#include <algorithm>

namespace kicad_format
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_starts_ always begins with 0, so the predecessor exists.
  const auto next_line = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(next_line - line_starts_.begin()) - 1;
  return {line_index + 1, offset - line_starts_[line_index] + 1};
}

std::string_view SourceFile::line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  std::string_view text = std::string_view(content_).substr(line_starts_[line_index]);
  const auto newline = text.find('\n');
  if (newline != std::string_view::npos) {
    text = text.substr(0, newline);
  }
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  return text;
}

FullSourceRange SourceFile::full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const LineColumn start = line_column(result.start_byte);
  const LineColumn end = line_column(result.end_byte);
  result.start_line = start.line;
  result.start_column = start.column;
  result.end_line = end.line;
  result.end_column = end.column;
  return result;
}

FileId SourceRegistry::add(std::filesystem::path path, std::string content)
{
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  return id;
}

const SourceFile * SourceRegistry::file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

std::string SourceRegistry::path_string(FileId id) const
{
  const SourceFile * f = file(id);
  return f != nullptr ? f->path().string() : std::string("<unknown>");
}

FullSourceRange SourceRegistry::full_range(SourceRange range) const noexcept
{
  const SourceFile * f = file(range.file_id());
  if (f == nullptr) {
    return {};
  }
  return f->full_range(range);
}

}  // namespace kicad_format
