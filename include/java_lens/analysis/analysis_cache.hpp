// java_lens/analysis/analysis_cache.hpp - Content-addressed memo of per-file analyses
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "java_lens/analysis/analysis_options.hpp"
#include "java_lens/analysis/file_analysis.hpp"
#include "java_lens/basic/cancellation.hpp"
#include "java_lens/syntax/parser.hpp"

namespace java_lens
{

/// 32-bit FNV-1a over the bytes of `text`.
[[nodiscard]] uint32_t fingerprint(std::string_view text) noexcept;

/**
 * A document as supplied by the host.
 */
struct DocumentInput
{
  std::string uri;        // cache identity
  std::string file_path;  // used for the fallback class name; may be empty
  std::string text;
  std::string language_id = "java";
};

enum class CacheStatus : uint8_t {
  Ok,             // analysis available (possibly the empty oversize analysis)
  NotApplicable,  // not a Java document
  Unavailable,    // the grammar parser rejected the text
  Cancelled,      // cancellation raised before parsing
};

[[nodiscard]] std::string_view to_string(CacheStatus status) noexcept;

/**
 * Result of a cache lookup.
 */
struct CacheResult
{
  CacheStatus status = CacheStatus::Unavailable;
  std::shared_ptr<const FileAnalysis> analysis;  // set only when status is Ok
  std::vector<ParseError> errors;                // set only when status is Unavailable

  [[nodiscard]] bool is_ok() const noexcept { return status == CacheStatus::Ok && analysis; }

  static CacheResult ok(std::shared_ptr<const FileAnalysis> analysis)
  {
    CacheResult r;
    r.status = CacheStatus::Ok;
    r.analysis = std::move(analysis);
    return r;
  }

  static CacheResult with_status(CacheStatus status)
  {
    CacheResult r;
    r.status = status;
    return r;
  }

  static CacheResult unavailable(std::vector<ParseError> errors)
  {
    CacheResult r;
    r.status = CacheStatus::Unavailable;
    r.errors = std::move(errors);
    return r;
  }
};

/**
 * Memoizes FileAnalysis per document identity.
 *
 * An entry is keyed by (fingerprint, byte size) of the text it was computed
 * from and replaced wholesale when the text changes. Files above
 * `max_parse_bytes` get an empty analysis without parsing, which is not
 * stored. Parse failures are not stored either. There is no expiry; the
 * owner evicts.
 *
 * Not thread-safe: the lookup-compute-insert path assumes one thread of
 * control per cache.
 */
class AnalysisCache
{
public:
  /// `parser` must outlive the cache.
  explicit AnalysisCache(GrammarParser & parser, AnalysisOptions options = {});

  AnalysisCache(const AnalysisCache &) = delete;
  AnalysisCache & operator=(const AnalysisCache &) = delete;

  [[nodiscard]] CacheResult get_analysis(
    const DocumentInput & document, const CancellationFlag * cancel = nullptr);

  void evict(std::string_view uri);
  void clear() noexcept { entries_.clear(); }

  [[nodiscard]] bool contains(std::string_view uri) const;
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] const AnalysisOptions & options() const noexcept { return options_; }

private:
  struct Entry
  {
    uint32_t hash = 0;
    size_t size = 0;
    std::shared_ptr<const FileAnalysis> analysis;
  };

  GrammarParser & parser_;
  AnalysisOptions options_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace java_lens
