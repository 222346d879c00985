#include <gtest/gtest.h>

#include <string>

#include "java_lens/syntax/cst.hpp"
#include "java_lens/syntax/tree_utils.hpp"
#include "java_lens/test_support/parse_helpers.hpp"

using java_lens::test_support::CstBuilder;

namespace
{

// fieldDeclaration(unannType(int), variableDeclarator(variableDeclaratorId(x), =, 1), ;)
struct FieldTree
{
  java_lens::SyntaxTree tree;
  const java_lens::SyntaxNode * root = nullptr;
};

FieldTree build_field_tree(CstBuilder & b)
{
  auto * root = b.node("fieldDeclaration");
  auto * type = b.add_node(root, "unannType");
  b.add_token(type, "int");
  auto * decl = b.add_node(root, "variableDeclarator");
  auto * id = b.add_node(decl, "variableDeclaratorId");
  b.add_token(id, "count");
  b.add_token(decl, "=");
  b.add_token(decl, "10");
  b.add_token(root, ";");
  FieldTree out;
  out.tree = b.finish(root);
  out.root = out.tree.root();
  return out;
}

}  // namespace

TEST(SyntaxTreeUtils, CollectTokensVisitsEveryLeaf)
{
  CstBuilder b("  int count = 10;  ");
  const auto t = build_field_tree(b);
  ASSERT_NE(t.root, nullptr);

  const auto tokens = java_lens::collect_tokens(*t.root);
  ASSERT_EQ(tokens.size(), 5U);
  EXPECT_EQ(tokens[0]->image, "int");
  EXPECT_EQ(tokens[1]->image, "count");
  EXPECT_EQ(tokens[4]->image, ";");
}

TEST(SyntaxTreeUtils, TokensToTextSlicesSourceAndTrims)
{
  CstBuilder b("  int count = 10;  ");
  const auto t = build_field_tree(b);

  EXPECT_EQ(java_lens::tokens_to_text(java_lens::collect_tokens(*t.root), b.source()),
            "int count = 10;");
  EXPECT_EQ(java_lens::tokens_to_text({}, b.source()), "");
}

TEST(SyntaxTreeUtils, NodeRangeIsHalfOpen)
{
  CstBuilder b("  int count = 10;  ");
  const auto t = build_field_tree(b);

  const auto range = java_lens::node_range(*t.root);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->get_begin().get_offset(), 2U);
  EXPECT_EQ(range->get_end().get_offset(), 17U);

  const auto * id = java_lens::find_first_node(*t.root, "variableDeclaratorId");
  ASSERT_NE(id, nullptr);
  const auto id_range = java_lens::node_range(*id);
  ASSERT_TRUE(id_range.has_value());
  EXPECT_EQ(b.source().substr(id_range->get_begin().get_offset(), id_range->size()), "count");
}

TEST(SyntaxTreeUtils, NodeRangeOfEmptyNodeIsNothing)
{
  CstBuilder b("");
  auto * root = b.node("block");
  const auto tree = b.finish(root);
  EXPECT_FALSE(java_lens::node_range(*tree.root()).has_value());
}

TEST(SyntaxTreeUtils, FindAllNodesReportsNestedMatches)
{
  CstBuilder b("{ { } }");
  auto * outer = b.node("block");
  b.add_token(outer, "{");
  auto * inner = b.add_node(outer, "block");
  b.add_token(inner, "{");
  b.add_token(inner, "}");
  b.add_token(outer, "}");
  const auto tree = b.finish(outer);

  const auto blocks = java_lens::find_all_nodes(*tree.root(), "block");
  ASSERT_EQ(blocks.size(), 2U);
  EXPECT_EQ(blocks[0], tree.root());
  EXPECT_EQ(blocks[1], inner);

  EXPECT_EQ(java_lens::find_first_node(*tree.root(), "block"), tree.root());
  EXPECT_EQ(java_lens::find_first_node(*tree.root(), "classBody"), nullptr);
}

TEST(SyntaxTreeUtils, SortByOffsetRestoresSourceOrder)
{
  CstBuilder b("a b");
  auto * root = b.node("pair");
  // Slot order differs from source order.
  const auto ta = b.token("a");
  const auto tb = b.token("b");
  root->add_child("second", tb);
  root->add_child("first", ta);
  const auto tree = b.finish(root);

  auto tokens = java_lens::collect_tokens(*tree.root());
  ASSERT_EQ(tokens.size(), 2U);
  EXPECT_EQ(tokens[0]->image, "b");
  java_lens::sort_by_offset(tokens);
  EXPECT_EQ(tokens[0]->image, "a");
  EXPECT_EQ(tokens[1]->image, "b");
}

TEST(SyntaxTreeUtils, TrimStripsAsciiWhitespace)
{
  EXPECT_EQ(java_lens::trim("  \t x y \r\n"), "x y");
  EXPECT_EQ(java_lens::trim(" \n "), "");
  EXPECT_EQ(java_lens::trim(""), "");
}
