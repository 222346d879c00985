// java_lens/analysis/summarizer.hpp - Structural summary of a Java syntax tree
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/analysis/model.hpp"
#include "java_lens/syntax/cst.hpp"
#include "java_lens/syntax/tree_utils.hpp"

namespace java_lens
{

/**
 * Output of the structural pass over one compilation unit.
 */
struct StructuralSummary
{
  ClassSummary summary;
  std::vector<MethodDecl> method_decls;

  /// Text of the primary class declaration without its body
  /// (modifiers, name, extends/implements clauses). Empty when no class
  /// declaration was found.
  std::string class_header;
};

/**
 * Extract class name, package, fields and methods from a syntax tree.
 *
 * Never fails: declarations missing an expected sub-node are skipped, and
 * `fallback_class_name` is used when the tree holds no class declaration.
 * Constructors are not summarized.
 *
 * @param root        Root of the tree (compilationUnit)
 * @param source      Text the tree was parsed from
 * @param line_starts Line index of `source`
 * @param fallback_class_name Class name used when none is declared
 */
[[nodiscard]] StructuralSummary summarize(
  const SyntaxNode & root, std::string_view source, gsl::span<const uint32_t> line_starts,
  std::string_view fallback_class_name);

/// First access modifier among the tokens in source order; Package if none.
[[nodiscard]] Visibility visibility_of(const TokenList & tokens);

/// True if any token is `static`, wherever it appears.
[[nodiscard]] bool has_static(const TokenList & tokens) noexcept;

/// Package name with the `package` keyword and trailing `;` removed.
[[nodiscard]] std::string extract_package_name(const SyntaxNode & root, std::string_view source);

/// Names of every class declaration in discovery order (inner classes included).
[[nodiscard]] std::vector<std::string> extract_class_names(const SyntaxNode & root);

}  // namespace java_lens
