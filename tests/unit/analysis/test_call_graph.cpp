#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "java_lens/analysis/call_graph.hpp"
#include "java_lens/analysis/file_analysis.hpp"
#include "java_lens/syntax/parser.hpp"

namespace
{

const char * k_flow_source =
  "class Flow {\n"                                  // 1
  "  void a() { b(); b(); c(1); }\n"                // 2
  "  void b() { c(2); }\n"                          // 3
  "  void c(int x) { if (x > 0) c(x - 1); }\n"      // 4
  "  void d() { b(); missing(); c(1, 2); }\n"       // 5
  "}\n";

java_lens::FileAnalysis analyze(const std::string & src)
{
  java_lens::JavaParser parser;
  auto result = java_lens::analyze_java_source(parser, src, "Flow");
  EXPECT_TRUE(result.has_value());
  if (!result.has_value()) {
    return java_lens::empty_analysis("Flow");
  }
  return std::move(result).value();
}

uint32_t offset_of(const std::string & src, const std::string & needle)
{
  const auto pos = src.find(needle);
  EXPECT_NE(pos, std::string::npos) << "needle must exist: '" << needle << "'";
  return pos == std::string::npos ? 0U : static_cast<uint32_t>(pos);
}

}  // namespace

TEST(AnalysisCallGraph, CallersAreDeduplicatedAndCalleesResolvedByArity)
{
  const std::string src = k_flow_source;
  const auto a = analyze(src);

  const auto graph = java_lens::build_method_call_graph(
    a.method_decls, a.method_invocations, a.summary.class_name, "/src/Flow.java",
    offset_of(src, "void b()") + 6);
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(graph->method, "Flow.b(0)");

  ASSERT_EQ(graph->callers.size(), 2U);
  EXPECT_EQ(graph->callers[0].method_name, "a");
  EXPECT_EQ(graph->callers[0].line, 2U);
  EXPECT_EQ(graph->callers[1].method_name, "d");
  EXPECT_EQ(graph->callers[1].line, 5U);
  EXPECT_EQ(graph->callers[0].class_name, "Flow");
  EXPECT_EQ(graph->callers[0].file_path, "/src/Flow.java");

  ASSERT_EQ(graph->callees.size(), 1U);
  EXPECT_EQ(graph->callees[0].method_name, "c");
  EXPECT_EQ(graph->callees[0].line, 4U);
}

TEST(AnalysisCallGraph, EdgeDirectionFollowsTheCall)
{
  const std::string src = k_flow_source;
  const auto a = analyze(src);

  // a -> b: b is a callee of a, and a is a caller of b.
  const auto of_a = java_lens::build_method_call_graph(
    a.method_decls, a.method_invocations, "Flow", "Flow.java", offset_of(src, "void a()"));
  ASSERT_TRUE(of_a.has_value());
  ASSERT_EQ(of_a->callees.size(), 3U);  // b, b, c: one entry per call site
  EXPECT_EQ(of_a->callees[0].method_name, "b");
  EXPECT_EQ(of_a->callees[1].method_name, "b");
  EXPECT_EQ(of_a->callees[2].method_name, "c");
  EXPECT_TRUE(of_a->callers.empty());
}

TEST(AnalysisCallGraph, UnresolvedAndWrongArityCallsAreDropped)
{
  const std::string src = k_flow_source;
  const auto a = analyze(src);

  const auto of_d = java_lens::build_method_call_graph(
    a.method_decls, a.method_invocations, "Flow", "Flow.java", offset_of(src, "void d()"));
  ASSERT_TRUE(of_d.has_value());
  ASSERT_EQ(of_d->callees.size(), 1U);
  EXPECT_EQ(of_d->callees[0].method_name, "b");
}

TEST(AnalysisCallGraph, RecursionCountsAsCallerAndCallee)
{
  const std::string src = k_flow_source;
  const auto a = analyze(src);

  const auto of_c = java_lens::build_method_call_graph(
    a.method_decls, a.method_invocations, "Flow", "Flow.java", offset_of(src, "c(int x)"));
  ASSERT_TRUE(of_c.has_value());
  EXPECT_EQ(of_c->method, "Flow.c(1)");

  ASSERT_EQ(of_c->callers.size(), 3U);
  EXPECT_EQ(of_c->callers[0].method_name, "a");
  EXPECT_EQ(of_c->callers[1].method_name, "b");
  EXPECT_EQ(of_c->callers[2].method_name, "c");

  ASSERT_EQ(of_c->callees.size(), 1U);
  EXPECT_EQ(of_c->callees[0].method_name, "c");
}

TEST(AnalysisCallGraph, CursorOutsideAnyMethodHasNoGraph)
{
  const std::string src = k_flow_source;
  const auto a = analyze(src);

  EXPECT_FALSE(java_lens::build_method_call_graph(
                 a.method_decls, a.method_invocations, "Flow", "Flow.java", 0)
                 .has_value());
}

TEST(AnalysisCallGraph, FormatsMethodReference)
{
  java_lens::MethodRef ref;
  ref.class_name = "Flow";
  ref.method_name = "b";
  ref.file_path = "/work/src/Flow.java";
  ref.line = 3;
  EXPECT_EQ(java_lens::format_method_ref(ref), "Flow.b \xC2\xB7 Flow.java:3");
}
