// java_lens/analysis/lifecycle.hpp - Android framework lifecycle heuristics
//
// Both detectors are naming heuristics layered on the structural summary.
// Finding nothing is a normal outcome.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/analysis/analysis_options.hpp"
#include "java_lens/analysis/model.hpp"
#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

/// Placeholder used when a registration call has no string literal on its line.
inline constexpr std::string_view k_unknown_binder_name = "<unknown>";

/// True when the class header reads `extends SystemService`.
[[nodiscard]] bool extends_system_service(std::string_view class_header) noexcept;

/// Contents of the first double-quoted literal in a line of text.
[[nodiscard]] std::optional<std::string> first_quoted_text(std::string_view line);

/**
 * Summarize a SystemService subclass.
 *
 * Produced only when `class_header` extends SystemService. Records the
 * first `onStart` method, every `onBootPhase` method, and every call to
 * `publishBinderService` or `addService` with the service name read from
 * the call's source line.
 */
[[nodiscard]] std::optional<SystemServiceSummary> detect_system_service(
  std::string_view class_name, std::string_view class_header,
  const std::vector<MethodDecl> & decls, const std::vector<MethodInvocation> & invocations,
  const SourceManager & source);

/// True when the file's base name is one of the configured lifecycle targets.
[[nodiscard]] bool is_lifecycle_target(std::string_view file_path, const AnalysisOptions & options);

/**
 * Timeline of the configured lifecycle methods declared in one file,
 * sorted by line.
 */
[[nodiscard]] LifecycleTimeline build_lifecycle_timeline(
  std::string_view file_path, std::string_view class_name, const std::vector<MethodDecl> & decls,
  const AnalysisOptions & options);

/// "Class (File.java)"
[[nodiscard]] std::string format_timeline_label(const LifecycleTimeline & timeline);

}  // namespace java_lens
