// java_lens/analysis/analysis_cache.cpp - Content-addressed memo of per-file analyses
#include "java_lens/analysis/analysis_cache.hpp"

#include <utility>

namespace java_lens
{

uint32_t fingerprint(std::string_view text) noexcept
{
  uint32_t hash = 2166136261u;
  for (const char c : text) {
    hash ^= static_cast<uint8_t>(c);
    hash *= 16777619u;
  }
  return hash;
}

std::string_view to_string(CacheStatus status) noexcept
{
  switch (status) {
    case CacheStatus::Ok:
      return "ok";
    case CacheStatus::NotApplicable:
      return "not-applicable";
    case CacheStatus::Unavailable:
      return "unavailable";
    case CacheStatus::Cancelled:
      return "cancelled";
  }
  return "unavailable";
}

AnalysisCache::AnalysisCache(GrammarParser & parser, AnalysisOptions options)
: parser_(parser), options_(std::move(options))
{
}

CacheResult AnalysisCache::get_analysis(
  const DocumentInput & document, const CancellationFlag * cancel)
{
  if (document.language_id != "java") {
    return CacheResult::with_status(CacheStatus::NotApplicable);
  }

  const std::string fallback =
    fallback_class_name(document.file_path.empty() ? document.uri : document.file_path);

  const size_t size = document.text.size();
  if (size > options_.max_parse_bytes) {
    return CacheResult::ok(std::make_shared<const FileAnalysis>(empty_analysis(fallback)));
  }

  const uint32_t hash = fingerprint(document.text);
  if (auto it = entries_.find(document.uri); it != entries_.end()) {
    if (it->second.hash == hash && it->second.size == size) {
      return CacheResult::ok(it->second.analysis);
    }
  }

  if (is_cancelled(cancel)) {
    return CacheResult::with_status(CacheStatus::Cancelled);
  }

  auto result = analyze_java_source(parser_, document.text, fallback);
  if (!result) {
    return CacheResult::unavailable(result.error());
  }

  auto analysis = std::make_shared<const FileAnalysis>(std::move(result).value());
  entries_[document.uri] = Entry{hash, size, analysis};
  return CacheResult::ok(std::move(analysis));
}

void AnalysisCache::evict(std::string_view uri) { entries_.erase(std::string(uri)); }

bool AnalysisCache::contains(std::string_view uri) const
{
  return entries_.find(std::string(uri)) != entries_.end();
}

}  // namespace java_lens
