// java_lens/basic/source_manager.hpp - Source offsets, ranges and line index
//
// This header provides types for tracking source code locations and ranges,
// plus the offset -> line index shared by every analysis pass.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

namespace java_lens
{

/// A 0-based byte offset into one file, or the invalid sentinel.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

/**
 * Half-open byte range [start, end).
 *
 * An end before the start is clamped to the start.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)),
    end_(SourceLocation(end_offset < start_offset ? start_offset : end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - start_.get_offset() : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_.get_offset() == other.start_.get_offset() &&
           end_.get_offset() == other.end_.get_offset();
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// Line index
// ============================================================================

/// Ascending byte offsets of every line start. Offset 0 is always present.
using LineIndex = std::vector<uint32_t>;

/**
 * Build the line index of a source text.
 *
 * One entry per '\n' found, pointing at the byte just after the break.
 */
[[nodiscard]] LineIndex build_line_index(std::string_view source);

/**
 * Map a byte offset to a 1-based line number.
 *
 * Binary search for the greatest line start <= offset. Offsets before the
 * first recorded start (or an empty index) resolve to line 1.
 */
[[nodiscard]] uint32_t offset_to_line(uint32_t offset, gsl::span<const uint32_t> line_starts) noexcept;

// 1-based; zero means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

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

/// Owns one file's text, its optional path and its line index.
class SourceManager
{
public:
  SourceManager() { build_line_table(); }
  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] gsl::span<const uint32_t> line_starts() const noexcept { return line_offsets_; }

  /// 1-based line of a byte offset
  [[nodiscard]] uint32_t get_line(uint32_t offset) const noexcept
  {
    return offset_to_line(offset, line_offsets_);
  }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its line break
  [[nodiscard]] std::string_view get_line_text(uint32_t line_index) const noexcept;

  /// Line/column of both ends; invalid ranges yield start_line 0
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table() { line_offsets_ = build_line_index(source_); }

  std::filesystem::path file_path_;
  std::string source_;
  LineIndex line_offsets_;
};

}  // namespace java_lens
