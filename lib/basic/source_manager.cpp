// spawn_dsl/basic/source_manager.cpp - SourceFile implementation
#include "spawn_dsl/basic/source_manager.hpp"

#include <algorithm>
#include <system_error>

namespace spawn_dsl
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

std::string SourceFile::display_name() const
{
  if (path_.empty()) {
    return "<input>";
  }

  std::error_code ec;
  const auto rel = std::filesystem::relative(path_, std::filesystem::current_path(), ec);
  if (ec || rel.empty()) {
    return path_.string();
  }
  return rel.string();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] == 0, so `it` never precedes begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;  // drop '\n'
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }

  const uint32_t start = range.get_begin().get_offset();
  const uint32_t end =
    std::min(range.get_end().get_offset(), static_cast<uint32_t>(content_.size()));
  if (start >= end) {
    return {};
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange out;
  if (range.is_invalid()) {
    return out;
  }

  out.start_byte = range.get_begin().get_offset();
  out.end_byte = range.get_end().get_offset();

  const LineColumn b = get_line_column(out.start_byte);
  const LineColumn e = get_line_column(out.end_byte);
  out.start_line = b.line;
  out.start_column = b.column;
  out.end_line = e.line;
  out.end_column = e.column;
  return out;
}

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace spawn_dsl
