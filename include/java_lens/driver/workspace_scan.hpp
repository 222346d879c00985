// java_lens/driver/workspace_scan.hpp - Multi-file scans over a source tree
//
// Host-side passes that enumerate Java files under a directory and feed
// them through an AnalysisCache. Used by the jlens CLI and the language
// server.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "java_lens/analysis/analysis_cache.hpp"
#include "java_lens/analysis/analysis_options.hpp"
#include "java_lens/analysis/model.hpp"
#include "java_lens/basic/cancellation.hpp"

namespace java_lens
{

// ============================================================================
// File helpers
// ============================================================================

/// Whole file contents, or nothing when the file cannot be opened.
[[nodiscard]] std::optional<std::string> read_file_to_string(const std::filesystem::path & path);

/// "file:///abs/path" for an absolute path.
[[nodiscard]] std::string path_to_file_uri(const std::filesystem::path & path);

/// Path of a file:// URI with percent-escapes decoded.
[[nodiscard]] std::optional<std::filesystem::path> file_uri_to_path(std::string_view uri);

/**
 * Regular files under `root` whose names pass `filter`.
 *
 * Directories named in `options.exclude_dirs` are not descended into.
 * Unreadable directories are skipped. The result is sorted.
 */
template <typename Filter>
[[nodiscard]] std::vector<std::filesystem::path> find_files(
  const std::filesystem::path & root, const ScanOptions & options, Filter filter);

/**
 * Java files under `root`.
 *
 * @param file_name When non-empty, only files with exactly this name.
 */
[[nodiscard]] std::vector<std::filesystem::path> find_java_files(
  const std::filesystem::path & root, const ScanOptions & options,
  std::string_view file_name = {});

// ============================================================================
// Scans
// ============================================================================

struct SystemServiceEntry
{
  std::string file_path;
  SystemServiceSummary summary;
};

/**
 * SystemService subclasses found under `root`, in file order.
 *
 * Cancellation is checked before each file; a cancelled scan returns what
 * it found so far. Unreadable files and unavailable analyses are skipped.
 */
[[nodiscard]] std::vector<SystemServiceEntry> scan_system_services(
  AnalysisCache & cache, const std::filesystem::path & root, const ScanOptions & options,
  const CancellationFlag * cancel = nullptr);

/**
 * Lifecycle timelines of every configured target file under `root`.
 *
 * Targets are visited in the order of `lifecycle_target_files` in the
 * cache's options; files sharing a name appear in path order.
 */
[[nodiscard]] std::vector<LifecycleTimeline> build_lifecycle_timelines(
  AnalysisCache & cache, const std::filesystem::path & root, const ScanOptions & options,
  const CancellationFlag * cancel = nullptr);

// ============================================================================
// Template implementation
// ============================================================================

template <typename Filter>
std::vector<std::filesystem::path> find_files(
  const std::filesystem::path & root, const ScanOptions & options, Filter filter)
{
  namespace fs = std::filesystem;

  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return out;
  }

  auto is_excluded = [&](const fs::path & dir) {
    const std::string name = dir.filename().string();
    for (const auto & ex : options.exclude_dirs) {
      if (name == ex) return true;
    }
    return false;
  };

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    const fs::directory_entry & entry = *it;
    if (entry.is_directory(ec)) {
      if (is_excluded(entry.path())) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(ec) && filter(entry.path())) {
      out.push_back(entry.path());
    }
    it.increment(ec);
  }

  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace java_lens
