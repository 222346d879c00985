// java_lens/analysis/file_analysis.cpp - Per-file analysis pipeline
#include "java_lens/analysis/file_analysis.hpp"

#include <filesystem>
#include <utility>

#include "java_lens/analysis/invocation_scanner.hpp"
#include "java_lens/analysis/lifecycle.hpp"
#include "java_lens/analysis/summarizer.hpp"
#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

FileAnalysis empty_analysis(std::string_view fallback_class_name)
{
  FileAnalysis out;
  out.summary.class_name = std::string(fallback_class_name);
  return out;
}

std::string fallback_class_name(std::string_view file_path)
{
  constexpr std::string_view k_ext = ".java";
  std::string base = std::filesystem::path(std::string(file_path)).filename().string();
  if (base.size() > k_ext.size() && base.compare(base.size() - k_ext.size(), k_ext.size(), k_ext) == 0) {
    base.resize(base.size() - k_ext.size());
  }
  return base;
}

ParseResult<FileAnalysis> analyze_java_source(
  GrammarParser & parser, std::string_view source, std::string_view fallback_class_name)
{
  auto parsed = parser.parse(source);
  if (!parsed) {
    return parsed.error();
  }
  const SyntaxTree & tree = parsed.value();
  if (tree.root() == nullptr) {
    return std::vector<ParseError>{ParseError{"parser returned an empty tree", SourceRange(0, 0)}};
  }

  const SourceManager sm{std::string(source)};

  StructuralSummary structure = summarize(*tree.root(), source, sm.line_starts(), fallback_class_name);

  FileAnalysis out;
  out.method_invocations = scan_method_bodies(structure.method_decls, source, sm.line_starts());
  out.system_service = detect_system_service(
    structure.summary.class_name, structure.class_header, structure.method_decls,
    out.method_invocations, sm);
  out.summary = std::move(structure.summary);
  out.method_decls = std::move(structure.method_decls);
  return out;
}

ClassSummary summarize_java_source(
  GrammarParser & parser, std::string_view source, std::string_view fallback_class_name)
{
  auto result = analyze_java_source(parser, source, fallback_class_name);
  if (!result) {
    return empty_analysis(fallback_class_name).summary;
  }
  return std::move(result).value().summary;
}

}  // namespace java_lens
