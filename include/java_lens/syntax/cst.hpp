// java_lens/syntax/cst.hpp - Generic concrete syntax tree (named nodes + tokens)
//
// The tree is deliberately loosely typed: a node is a name plus an ordered
// list of named child slots, each holding nodes and leaf tokens. Analyses
// locate structure by node name, so any grammar front-end that produces the
// expected names can feed them.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

// ============================================================================
// SyntaxToken
// ============================================================================

/**
 * Leaf of the syntax tree.
 *
 * Offsets are 0-based byte offsets into the parsed source. `end_offset` is
 * inclusive (the offset of the token's last byte); when absent the token is
 * a single character and ends where it starts.
 */
struct SyntaxToken
{
  std::string image;
  uint32_t start_offset = 0;
  std::optional<uint32_t> end_offset;

  [[nodiscard]] uint32_t last_offset() const noexcept { return end_offset.value_or(start_offset); }

  /// Half-open source range covered by the token
  [[nodiscard]] SourceRange range() const noexcept { return {start_offset, last_offset() + 1}; }
};

class SyntaxNode;

/// A child element: either a nested node or a leaf token.
using SyntaxElement = std::variant<const SyntaxNode *, SyntaxToken>;

/**
 * Named child slot. Slots keep insertion order; the same slot name never
 * appears twice on one node.
 */
struct ChildSlot
{
  std::string name;
  std::vector<SyntaxElement> elements;
};

// ============================================================================
// SyntaxNode
// ============================================================================

class SyntaxNode
{
public:
  explicit SyntaxNode(std::string name) : name_(std::move(name)) {}

  SyntaxNode(const SyntaxNode &) = delete;
  SyntaxNode & operator=(const SyntaxNode &) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const std::vector<ChildSlot> & slots() const noexcept { return slots_; }

  /// Elements of a slot, or nullptr if the slot does not exist.
  [[nodiscard]] const std::vector<SyntaxElement> * children(std::string_view slot) const noexcept;

  /// Append an element to a slot, creating the slot at the end if needed.
  void add_child(std::string_view slot, const SyntaxNode * node);
  void add_child(std::string_view slot, SyntaxToken token);

private:
  std::vector<SyntaxElement> & slot_for(std::string_view slot);

  std::string name_;
  std::vector<ChildSlot> slots_;
};

// ============================================================================
// SyntaxTree - owns every node of one parse
// ============================================================================

/**
 * Owner of a syntax tree's nodes.
 *
 * Nodes are heap-allocated individually, so raw node pointers stay valid
 * when the tree is moved.
 */
class SyntaxTree
{
public:
  SyntaxTree() = default;

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;
  SyntaxTree(SyntaxTree &&) noexcept = default;
  SyntaxTree & operator=(SyntaxTree &&) noexcept = default;

  /// Create a node owned by this tree.
  SyntaxNode * create(std::string name);

  void set_root(const SyntaxNode * root) noexcept { root_ = root; }

  [[nodiscard]] const SyntaxNode * root() const noexcept { return root_; }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }

private:
  std::vector<std::unique_ptr<SyntaxNode>> nodes_;
  const SyntaxNode * root_ = nullptr;
};

}  // namespace java_lens
