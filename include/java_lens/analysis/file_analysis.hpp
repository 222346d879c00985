// java_lens/analysis/file_analysis.hpp - Per-file analysis pipeline
//
// parse -> structural summary -> invocation scan -> system service heuristic
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/analysis/model.hpp"
#include "java_lens/syntax/parser.hpp"

namespace java_lens
{

/**
 * Everything derived from one file's text.
 */
struct FileAnalysis
{
  ClassSummary summary;
  std::vector<MethodDecl> method_decls;
  std::vector<MethodInvocation> method_invocations;
  std::optional<SystemServiceSummary> system_service;
};

/// Analysis with no declarations, named after `fallback_class_name`.
[[nodiscard]] FileAnalysis empty_analysis(std::string_view fallback_class_name);

/// Base name of a path with a trailing ".java" removed.
[[nodiscard]] std::string fallback_class_name(std::string_view file_path);

/**
 * Run the full pipeline over `source`.
 *
 * @return The analysis, or the grammar parser's errors.
 */
[[nodiscard]] ParseResult<FileAnalysis> analyze_java_source(
  GrammarParser & parser, std::string_view source, std::string_view fallback_class_name);

/**
 * Class summary of `source`, degraded to an empty summary named
 * `fallback_class_name` when the text does not parse.
 */
[[nodiscard]] ClassSummary summarize_java_source(
  GrammarParser & parser, std::string_view source, std::string_view fallback_class_name);

}  // namespace java_lens
