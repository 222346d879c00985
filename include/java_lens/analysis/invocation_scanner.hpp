// java_lens/analysis/invocation_scanner.hpp - Call-site scanning over raw text
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "java_lens/analysis/model.hpp"

namespace java_lens
{

/**
 * Count top-level arguments in the text between a call's parentheses.
 *
 * Commas nested in (), <>, [] or {} do not separate arguments. Each depth
 * counter is clamped at zero, so unbalanced input never goes negative.
 * Blank text has zero arguments; anything else has at least one.
 */
[[nodiscard]] uint32_t count_arguments(std::string_view args_text) noexcept;

/**
 * Index of the ')' matching the '(' at `open_index`.
 *
 * Parentheses inside single- or double-quoted literals are ignored, and a
 * backslash inside a literal skips the next character.
 */
[[nodiscard]] std::optional<size_t> find_matching_paren(
  std::string_view text, size_t open_index) noexcept;

/**
 * Find `name (` call sites inside `text`.
 *
 * Names in the call-keyword set (`if`, `while`, `new`, ...) are skipped, as
 * are sites whose parentheses never close.
 *
 * @param text        Span to scan, typically a method body
 * @param base_offset Offset of `text` within the file
 * @param line_starts Line index of the whole file
 * @return Invocations in discovery order
 */
[[nodiscard]] std::vector<MethodInvocation> scan_invocations(
  std::string_view text, uint32_t base_offset, gsl::span<const uint32_t> line_starts);

/**
 * Scan the body of every declaration that has one.
 *
 * Bodies of methods nested in other bodies (anonymous classes) are covered
 * by both scans; each call site is reported once, at its first discovery.
 */
[[nodiscard]] std::vector<MethodInvocation> scan_method_bodies(
  const std::vector<MethodDecl> & decls, std::string_view source,
  gsl::span<const uint32_t> line_starts);

}  // namespace java_lens
