// java_lens/syntax/tree_utils.hpp - Grammar-agnostic syntax tree queries
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/basic/source_manager.hpp"
#include "java_lens/syntax/cst.hpp"

namespace java_lens
{

using TokenList = std::vector<const SyntaxToken *>;
using NodeList = std::vector<const SyntaxNode *>;

/**
 * Depth-first collection of every leaf token under `node`, in slot order.
 *
 * Slot order is not necessarily source order. Sort by offset
 * (`sort_by_offset`) when source order matters.
 */
[[nodiscard]] TokenList collect_tokens(const SyntaxNode & node);
void collect_tokens(const SyntaxNode & node, TokenList & out);

/// Pre-order search for the first node named `name`, `node` itself included.
[[nodiscard]] const SyntaxNode * find_first_node(const SyntaxNode & node, std::string_view name);

/**
 * Pre-order collection of every node named `name`.
 *
 * Matches nested inside other matches are reported too.
 */
void find_all_nodes(const SyntaxNode & node, std::string_view name, NodeList & out);
[[nodiscard]] NodeList find_all_nodes(const SyntaxNode & node, std::string_view name);

/// Stable sort of tokens by start offset.
void sort_by_offset(TokenList & tokens);

/**
 * Source text spanned by a set of tokens.
 *
 * Slices from the smallest start offset to the last token's inclusive end,
 * then trims surrounding whitespace. Empty for an empty list.
 */
[[nodiscard]] std::string tokens_to_text(const TokenList & tokens, std::string_view source);

/**
 * Half-open range covering every token under `node`
 * ([first start, last end + 1)), or nothing when the node has no tokens.
 */
[[nodiscard]] std::optional<SourceRange> node_range(const SyntaxNode & node);

/// Trim ASCII whitespace from both ends.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace java_lens
