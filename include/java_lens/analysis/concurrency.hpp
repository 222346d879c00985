// java_lens/analysis/concurrency.hpp - Lock hazard detection over raw text
//
// Purely textual: comments and string literals are not recognized, so a
// hazard-looking word inside either can produce a warning.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "java_lens/analysis/model.hpp"
#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

inline constexpr std::string_view k_binder_in_lock_message =
  "Binder call inside synchronized block may block other threads.";
inline constexpr std::string_view k_handler_in_lock_message =
  "Handler post/send inside synchronized block can cause lock inversion.";
inline constexpr std::string_view k_nested_lock_message = "Nested synchronized blocks detected.";

/// A `synchronized` block located by brace matching.
struct SynchronizedBlock
{
  uint32_t keyword_offset = 0;  // offset of `synchronized`
  uint32_t body_start = 0;      // first byte after '{'
  uint32_t body_end = 0;        // offset of the matching '}'
  uint32_t line = 0;            // line of the keyword
};

/**
 * Every `synchronized` occurrence followed by a brace-balanced block.
 *
 * Nested blocks are reported as well. Occurrences without a following '{'
 * or whose block never closes are skipped.
 */
[[nodiscard]] std::vector<SynchronizedBlock> find_synchronized_blocks(const SourceManager & source);

/**
 * Up to three warnings per block: binder call, handler post/send and nested
 * `synchronized`, in that order.
 */
[[nodiscard]] std::vector<ConcurrencyWarning> analyze_concurrency(const SourceManager & source);

/// Report warnings as JL001/JL002/JL003 diagnostics.
void report_concurrency_warnings(
  const std::vector<ConcurrencyWarning> & warnings, DiagnosticBag & diags);

}  // namespace java_lens
