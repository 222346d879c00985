// java_lens/syntax/cst.cpp - Generic syntax tree storage
#include "java_lens/syntax/cst.hpp"

#include <utility>

namespace java_lens
{

const std::vector<SyntaxElement> * SyntaxNode::children(std::string_view slot) const noexcept
{
  for (const auto & s : slots_) {
    if (s.name == slot) {
      return &s.elements;
    }
  }
  return nullptr;
}

std::vector<SyntaxElement> & SyntaxNode::slot_for(std::string_view slot)
{
  for (auto & s : slots_) {
    if (s.name == slot) {
      return s.elements;
    }
  }
  slots_.push_back(ChildSlot{std::string(slot), {}});
  return slots_.back().elements;
}

void SyntaxNode::add_child(std::string_view slot, const SyntaxNode * node)
{
  if (node == nullptr) {
    return;
  }
  slot_for(slot).emplace_back(node);
}

void SyntaxNode::add_child(std::string_view slot, SyntaxToken token)
{
  slot_for(slot).emplace_back(std::move(token));
}

SyntaxNode * SyntaxTree::create(std::string name)
{
  nodes_.push_back(std::make_unique<SyntaxNode>(std::move(name)));
  return nodes_.back().get();
}

}  // namespace java_lens
