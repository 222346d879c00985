// java_lens/syntax/tree_utils.cpp - Grammar-agnostic syntax tree queries
#include "java_lens/syntax/tree_utils.hpp"

#include <algorithm>

namespace java_lens
{

void collect_tokens(const SyntaxNode & node, TokenList & out)
{
  for (const auto & slot : node.slots()) {
    for (const auto & element : slot.elements) {
      if (const auto * token = std::get_if<SyntaxToken>(&element)) {
        out.push_back(token);
      } else if (const SyntaxNode * child = std::get<const SyntaxNode *>(element)) {
        collect_tokens(*child, out);
      }
    }
  }
}

TokenList collect_tokens(const SyntaxNode & node)
{
  TokenList out;
  collect_tokens(node, out);
  return out;
}

const SyntaxNode * find_first_node(const SyntaxNode & node, std::string_view name)
{
  if (node.name() == name) {
    return &node;
  }

  for (const auto & slot : node.slots()) {
    for (const auto & element : slot.elements) {
      const auto * child = std::get_if<const SyntaxNode *>(&element);
      if (child == nullptr || *child == nullptr) {
        continue;
      }
      if (const SyntaxNode * found = find_first_node(**child, name)) {
        return found;
      }
    }
  }
  return nullptr;
}

void find_all_nodes(const SyntaxNode & node, std::string_view name, NodeList & out)
{
  if (node.name() == name) {
    out.push_back(&node);
  }

  for (const auto & slot : node.slots()) {
    for (const auto & element : slot.elements) {
      const auto * child = std::get_if<const SyntaxNode *>(&element);
      if (child != nullptr && *child != nullptr) {
        find_all_nodes(**child, name, out);
      }
    }
  }
}

NodeList find_all_nodes(const SyntaxNode & node, std::string_view name)
{
  NodeList out;
  find_all_nodes(node, name, out);
  return out;
}

void sort_by_offset(TokenList & tokens)
{
  std::stable_sort(tokens.begin(), tokens.end(), [](const SyntaxToken * a, const SyntaxToken * b) {
    return a->start_offset < b->start_offset;
  });
}

std::string_view trim(std::string_view text) noexcept
{
  constexpr std::string_view k_ws = " \t\r\n\f\v";
  const auto first = text.find_first_not_of(k_ws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(k_ws);
  return text.substr(first, last - first + 1);
}

std::string tokens_to_text(const TokenList & tokens, std::string_view source)
{
  if (tokens.empty()) {
    return {};
  }

  TokenList sorted = tokens;
  sort_by_offset(sorted);

  const size_t start = sorted.front()->start_offset;
  const size_t end = static_cast<size_t>(sorted.back()->last_offset()) + 1;
  if (start >= source.size() || end <= start) {
    return {};
  }
  return std::string(trim(source.substr(start, end - start)));
}

std::optional<SourceRange> node_range(const SyntaxNode & node)
{
  TokenList tokens = collect_tokens(node);
  if (tokens.empty()) {
    return std::nullopt;
  }
  sort_by_offset(tokens);
  return SourceRange(tokens.front()->start_offset, tokens.back()->last_offset() + 1);
}

}  // namespace java_lens
