// java_lens/driver/workspace_scan.cpp - Multi-file scans over a source tree
#include "java_lens/driver/workspace_scan.hpp"

#include <fstream>
#include <sstream>

#include "java_lens/analysis/lifecycle.hpp"

namespace java_lens
{

namespace fs = std::filesystem;

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

/// Run one file through the cache. Nothing when unreadable or unavailable.
CacheResult analyze_file(
  AnalysisCache & cache, const fs::path & path, const CancellationFlag * cancel)
{
  auto text = read_file_to_string(path);
  if (!text) {
    return CacheResult::with_status(CacheStatus::Unavailable);
  }

  DocumentInput doc;
  doc.uri = path_to_file_uri(path);
  doc.file_path = path.string();
  doc.text = std::move(*text);
  return cache.get_analysis(doc, cancel);
}

}  // namespace

// ============================================================================
// File helpers
// ============================================================================

std::optional<std::string> read_file_to_string(const fs::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::string path_to_file_uri(const fs::path & path)
{
  // NOTE: This does not percent-encode.
  const std::string s = path.generic_string();
  if (!s.empty() && s[0] == '/') {
    return "file://" + s;
  }
  return "file:///" + s;
}

std::optional<fs::path> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }
  std::string_view rest = uri.substr(5);
  if (starts_with(rest, "//")) {
    rest = rest.substr(2);
    // Drop an authority component ("localhost" or empty)
    const size_t slash = rest.find('/');
    if (slash == std::string_view::npos) {
      return std::nullopt;
    }
    rest = rest.substr(slash);
  }
  if (rest.empty()) {
    return std::nullopt;
  }
  return fs::path(url_decode(rest));
}

std::vector<fs::path> find_java_files(
  const fs::path & root, const ScanOptions & options, std::string_view file_name)
{
  return find_files(root, options, [file_name](const fs::path & p) {
    const std::string name = p.filename().string();
    if (!file_name.empty()) {
      return name == file_name;
    }
    return p.extension() == ".java";
  });
}

// ============================================================================
// Scans
// ============================================================================

std::vector<SystemServiceEntry> scan_system_services(
  AnalysisCache & cache, const fs::path & root, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  std::vector<SystemServiceEntry> out;
  for (const auto & path : find_java_files(root, options)) {
    if (is_cancelled(cancel)) {
      break;
    }
    const CacheResult r = analyze_file(cache, path, cancel);
    if (!r.is_ok() || !r.analysis->system_service) {
      continue;
    }
    out.push_back(SystemServiceEntry{path.string(), *r.analysis->system_service});
  }
  return out;
}

std::vector<LifecycleTimeline> build_lifecycle_timelines(
  AnalysisCache & cache, const fs::path & root, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  std::vector<LifecycleTimeline> out;
  const AnalysisOptions & analysis_options = cache.options();

  for (const auto & target : analysis_options.lifecycle_target_files) {
    if (is_cancelled(cancel)) {
      break;
    }
    for (const auto & path : find_java_files(root, options, target)) {
      if (is_cancelled(cancel)) {
        return out;
      }
      const CacheResult r = analyze_file(cache, path, cancel);
      if (!r.is_ok()) {
        continue;
      }
      out.push_back(build_lifecycle_timeline(
        path.string(), r.analysis->summary.class_name, r.analysis->method_decls,
        analysis_options));
    }
  }
  return out;
}

}  // namespace java_lens
