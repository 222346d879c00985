// java_lens/basic/source_manager.cpp - Line index and source location services
#include "java_lens/basic/source_manager.hpp"

#include <algorithm>

namespace java_lens
{

// ============================================================================
// Line index
// ============================================================================

LineIndex build_line_index(std::string_view source)
{
  LineIndex starts;
  starts.push_back(0);

  for (size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\n') {
      starts.push_back(static_cast<uint32_t>(i + 1));
    }
  }
  return starts;
}

uint32_t offset_to_line(uint32_t offset, gsl::span<const uint32_t> line_starts) noexcept
{
  if (line_starts.empty()) {
    return 1;
  }

  auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
  if (it == line_starts.begin()) {
    return 1;
  }
  return static_cast<uint32_t>(it - line_starts.begin());
}

// ============================================================================
// SourceManager
// ============================================================================

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  const uint32_t line = offset_to_line(offset, line_offsets_);
  const uint32_t column = offset - line_offsets_[line - 1] + 1;
  return {line, column};
}

std::string_view SourceManager::get_line_text(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && source_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(source_).substr(start, end - start);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().get_offset();
  result.end_byte = range.get_end().get_offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

}  // namespace java_lens
