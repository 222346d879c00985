// java_lens/analysis/call_graph.hpp - Single-file caller/callee resolution
//
// Resolution is by (name, argument count) within one file. Overloads of
// equal arity and inherited methods are not told apart.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/analysis/model.hpp"

namespace java_lens
{

/// First declaration whose [start, end] offsets contain `offset`.
[[nodiscard]] const MethodDecl * find_method_at_offset(
  const std::vector<MethodDecl> & decls, uint32_t offset) noexcept;

/// First declaration whose body range (declaration range if bodiless)
/// contains `offset`.
[[nodiscard]] const MethodDecl * find_enclosing_method(
  const std::vector<MethodDecl> & decls, uint32_t offset) noexcept;

/// "Class.method(paramsCount)"
[[nodiscard]] std::string method_label(std::string_view class_name, const MethodDecl & decl);

/**
 * Build the call graph of the method under `cursor_offset`.
 *
 * @return Nothing when the cursor is not inside any method declaration.
 */
[[nodiscard]] std::optional<MethodCallGraph> build_method_call_graph(
  const std::vector<MethodDecl> & decls, const std::vector<MethodInvocation> & invocations,
  std::string_view class_name, std::string_view file_path, uint32_t cursor_offset);

/// "Class.method · File.java:line" (base name of the file only)
[[nodiscard]] std::string format_method_ref(const MethodRef & ref);

}  // namespace java_lens
