#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "java_lens/analysis/summarizer.hpp"
#include "java_lens/test_support/parse_helpers.hpp"

using java_lens::Visibility;
using java_lens::test_support::CstBuilder;
using java_lens::test_support::parse_java;

namespace
{

java_lens::StructuralSummary summarize_source(
  const std::string & src, std::string_view fallback = "Fallback")
{
  const auto unit = parse_java(src);
  EXPECT_TRUE(unit.result.has_value()) << "fixture must parse";
  if (!unit.result.has_value()) {
    return {};
  }
  return java_lens::summarize(*unit.root(), unit.source.get_source(), unit.source.line_starts(), fallback);
}

}  // namespace

TEST(AnalysisSummarizer, PackageAndClassName)
{
  const auto s = summarize_source(
    "package com.example.app;\n"
    "\n"
    "public class Foo {}\n");
  EXPECT_EQ(s.summary.package_name, "com.example.app");
  EXPECT_EQ(s.summary.class_name, "Foo");
  EXPECT_TRUE(s.summary.inner_classes.empty());
}

TEST(AnalysisSummarizer, FallbackNameWithoutClassDeclaration)
{
  const auto s = summarize_source("interface Only { void f(); }\n", "Only");
  EXPECT_EQ(s.summary.class_name, "Only");
  EXPECT_EQ(s.summary.package_name, "");
  EXPECT_TRUE(s.summary.methods.empty());
  EXPECT_TRUE(s.class_header.empty());
}

TEST(AnalysisSummarizer, InnerClassesInDeclarationOrder)
{
  const auto s = summarize_source(
    "public class Outer {\n"
    "  static class Inner {}\n"
    "  class Helper { class Deep {} }\n"
    "}\n");
  EXPECT_EQ(s.summary.class_name, "Outer");
  ASSERT_EQ(s.summary.inner_classes.size(), 3U);
  EXPECT_EQ(s.summary.inner_classes[0], "Inner");
  EXPECT_EQ(s.summary.inner_classes[1], "Helper");
  EXPECT_EQ(s.summary.inner_classes[2], "Deep");
}

TEST(AnalysisSummarizer, InnerClassListNeverContainsPrimaryName)
{
  const auto s = summarize_source("class Node { class Node {} class Edge {} }\n");
  EXPECT_EQ(s.summary.class_name, "Node");
  ASSERT_EQ(s.summary.inner_classes.size(), 1U);
  EXPECT_EQ(s.summary.inner_classes[0], "Edge");
}

TEST(AnalysisSummarizer, FieldsSplitPerDeclarator)
{
  const auto s = summarize_source(
    "public class Foo {\n"
    "  private static final int MAX = 3;\n"
    "  String a, b;\n"
    "  protected java.util.List<String> items;\n"
    "}\n");
  const auto & fields = s.summary.fields;
  ASSERT_EQ(fields.size(), 4U);

  EXPECT_EQ(fields[0].name, "MAX");
  EXPECT_EQ(fields[0].type, "int");
  EXPECT_EQ(fields[0].visibility, Visibility::Private);
  EXPECT_TRUE(fields[0].is_static);
  EXPECT_EQ(fields[0].start_line, 2U);

  EXPECT_EQ(fields[1].name, "a");
  EXPECT_EQ(fields[2].name, "b");
  for (size_t i = 1; i <= 2; ++i) {
    EXPECT_EQ(fields[i].type, "String");
    EXPECT_EQ(fields[i].visibility, Visibility::Package);
    EXPECT_FALSE(fields[i].is_static);
    EXPECT_EQ(fields[i].start_line, 3U);
  }

  EXPECT_EQ(fields[3].name, "items");
  EXPECT_EQ(fields[3].type, "java.util.List<String>");
  EXPECT_EQ(fields[3].visibility, Visibility::Protected);
}

TEST(AnalysisSummarizer, FieldInitializerDoesNotLeakDeclarators)
{
  const auto s = summarize_source(
    "class Foo {\n"
    "  Runnable r = () -> { int local = 1; };\n"
    "}\n");
  ASSERT_EQ(s.summary.fields.size(), 1U);
  EXPECT_EQ(s.summary.fields[0].name, "r");
}

TEST(AnalysisSummarizer, MethodsWithVisibilityStaticAndSignature)
{
  const std::string src =
    "abstract class Bar {\n"
    "  int size() { return 0; }\n"
    "  protected static void helper(int a, int b) {}\n"
    "  @Override\n"
    "  public String toString() { return \"\"; }\n"
    "  abstract void later(String... parts);\n"
    "  Bar() {}\n"
    "}\n";
  const auto s = summarize_source(src);

  ASSERT_EQ(s.method_decls.size(), 4U);
  ASSERT_EQ(s.summary.methods.size(), 4U);

  const auto & size = s.method_decls[0];
  EXPECT_EQ(size.name, "size");
  EXPECT_EQ(size.params_count, 0U);
  EXPECT_EQ(size.visibility, Visibility::Package);
  EXPECT_FALSE(size.is_static);
  EXPECT_EQ(size.signature, "int size(0)");
  ASSERT_TRUE(size.has_body());
  EXPECT_EQ(*size.body_start_offset, src.find("{ return 0; }"));
  EXPECT_EQ(*size.body_end_offset, src.find("{ return 0; }") + std::string("{ return 0; }").size());

  const auto & helper = s.method_decls[1];
  EXPECT_EQ(helper.visibility, Visibility::Protected);
  EXPECT_TRUE(helper.is_static);
  EXPECT_EQ(helper.params_count, 2U);
  EXPECT_EQ(helper.signature, "void helper(2)");

  const auto & to_string = s.method_decls[2];
  EXPECT_EQ(to_string.visibility, Visibility::Public);
  EXPECT_EQ(to_string.signature, "String toString(0)");
  // The declaration starts at its annotation; the line is the name's line.
  EXPECT_EQ(to_string.start_offset, src.find("@Override"));
  EXPECT_EQ(to_string.start_line, 5U);
  EXPECT_EQ(s.summary.methods[2].start_line, 5U);

  const auto & later = s.method_decls[3];
  EXPECT_EQ(later.params_count, 1U);
  EXPECT_FALSE(later.has_body());
  EXPECT_EQ(later.end_offset, src.find("later(String... parts);") + std::string("later(String... parts);").size());
}

TEST(AnalysisSummarizer, ClassHeaderExcludesBody)
{
  const auto s = summarize_source(
    "public final class PowerService extends SystemService implements Runnable {\n"
    "  public void run() {}\n"
    "}\n");
  EXPECT_EQ(s.class_header, "public final class PowerService extends SystemService implements Runnable");
}

TEST(AnalysisSummarizer, VisibilityFollowsFirstAccessModifier)
{
  CstBuilder b("static protected private x");
  java_lens::TokenList tokens;
  const auto t_static = b.token("static");
  const auto t_protected = b.token("protected");
  const auto t_private = b.token("private");
  tokens.push_back(&t_private);
  tokens.push_back(&t_protected);
  tokens.push_back(&t_static);

  EXPECT_EQ(java_lens::visibility_of(tokens), Visibility::Protected);
  EXPECT_TRUE(java_lens::has_static(tokens));

  const java_lens::TokenList none;
  EXPECT_EQ(java_lens::visibility_of(none), Visibility::Package);
  EXPECT_FALSE(java_lens::has_static(none));
}

TEST(AnalysisSummarizer, MethodWithoutDeclaratorIsSkipped)
{
  CstBuilder b("void broken ; void ok ( ) ;");
  auto * root = b.node("compilationUnit");
  auto * broken = b.add_node(root, "methodDeclaration");
  b.add_token(broken, "void");
  b.add_token(broken, "broken");
  b.add_token(broken, ";");
  auto * ok = b.add_node(root, "methodDeclaration");
  auto * result = b.add_node(ok, "result");
  b.add_token(result, "void");
  auto * declarator = b.add_node(ok, "methodDeclarator");
  b.add_token(declarator, "ok");
  b.add_token(declarator, "(");
  b.add_token(declarator, ")");
  b.add_token(ok, ";");
  const auto tree = b.finish(root);
  const auto line_starts = b.line_starts();

  const auto s = java_lens::summarize(*tree.root(), b.source(), line_starts, "Fallback");
  EXPECT_EQ(s.summary.class_name, "Fallback");
  ASSERT_EQ(s.method_decls.size(), 1U);
  EXPECT_EQ(s.method_decls[0].name, "ok");
  EXPECT_EQ(s.method_decls[0].signature, "void ok(0)");
  ASSERT_EQ(s.summary.methods.size(), 1U);
}

TEST(AnalysisSummarizer, ReceiverParameterCountsTowardArity)
{
  const auto s = summarize_source(
    "class A {\n"
    "  void h(A this) {}\n"
    "  void k() {}\n"
    "}\n");
  ASSERT_EQ(s.method_decls.size(), 2U);
  EXPECT_EQ(s.method_decls[0].params_count, 1U);
  EXPECT_EQ(s.method_decls[0].signature, "void h(1)");
  EXPECT_EQ(s.method_decls[1].params_count, 0U);
}

TEST(AnalysisSummarizer, GenericParameterTypeCountsOnce)
{
  const auto s = summarize_source(
    "class A {\n"
    "  void g(Map<String, Integer> m) {}\n"
    "  void k(Map<String, List<Integer>> m, int... rest) {}\n"
    "}\n");
  ASSERT_EQ(s.method_decls.size(), 2U);
  EXPECT_EQ(s.method_decls[0].params_count, 1U);
  EXPECT_EQ(s.method_decls[0].signature, "void g(1)");
  EXPECT_EQ(s.method_decls[1].params_count, 2U);
}
