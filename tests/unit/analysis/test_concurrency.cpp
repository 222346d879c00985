#include <gtest/gtest.h>

#include <string>

#include "java_lens/analysis/concurrency.hpp"
#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"

using java_lens::ConcurrencyHazard;
using java_lens::SourceManager;

TEST(AnalysisConcurrency, FindsMatchedBlocks)
{
  const std::string src =
    "class A {\n"
    "  void f() {\n"
    "    synchronized (mLock) { if (x) { y(); } }\n"
    "  }\n"
    "}\n";
  const SourceManager sm(src);
  const auto blocks = java_lens::find_synchronized_blocks(sm);
  ASSERT_EQ(blocks.size(), 1U);
  EXPECT_EQ(blocks[0].keyword_offset, src.find("synchronized"));
  EXPECT_EQ(blocks[0].body_start, src.find("{ if") + 1);
  EXPECT_EQ(blocks[0].body_end, src.find("} }\n  }") + 2);
  EXPECT_EQ(blocks[0].line, 3U);
}

TEST(AnalysisConcurrency, BinderCallInsideLock)
{
  const std::string src =
    "class A {\n"
    "  void f() {\n"
    "    synchronized (mLock) {\n"
    "      mRemote.transact(CODE, data, reply, 0);\n"
    "    }\n"
    "  }\n"
    "}\n";
  const SourceManager sm(src);
  const auto warnings = java_lens::analyze_concurrency(sm);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].hazard, ConcurrencyHazard::BinderCallInLock);
  EXPECT_EQ(warnings[0].line, 3U);
  EXPECT_EQ(warnings[0].message, java_lens::k_binder_in_lock_message);
  EXPECT_EQ(warnings[0].range.get_begin().get_offset(), src.find("synchronized"));
  EXPECT_EQ(warnings[0].range.get_end().get_offset(), src.find("}\n  }") + 1);
}

TEST(AnalysisConcurrency, BinderAndNestedLockGiveTwoWarnings)
{
  const std::string src =
    "class A {\n"
    "  void f() {\n"
    "    synchronized (a) {\n"
    "      b.transact(1);\n"
    "      synchronized (c) { x = 1; }\n"
    "    }\n"
    "  }\n"
    "}\n";
  const SourceManager sm(src);
  const auto warnings = java_lens::analyze_concurrency(sm);
  ASSERT_EQ(warnings.size(), 2U);
  EXPECT_EQ(warnings[0].hazard, ConcurrencyHazard::BinderCallInLock);
  EXPECT_EQ(warnings[1].hazard, ConcurrencyHazard::NestedLock);
  EXPECT_EQ(warnings[1].message, java_lens::k_nested_lock_message);
  EXPECT_EQ(warnings[0].line, 3U);
  EXPECT_EQ(warnings[1].line, 3U);
}

TEST(AnalysisConcurrency, HandlerCallsNeedWordStart)
{
  {
    const SourceManager sm("void f() { synchronized (l) { mHandler.post(r); } }");
    const auto warnings = java_lens::analyze_concurrency(sm);
    ASSERT_EQ(warnings.size(), 1U);
    EXPECT_EQ(warnings[0].hazard, ConcurrencyHazard::HandlerCallInLock);
    EXPECT_EQ(warnings[0].message, java_lens::k_handler_in_lock_message);
  }
  {
    // "repost(" is not a handler call.
    const SourceManager sm("void f() { synchronized (l) { repost(r); } }");
    EXPECT_TRUE(java_lens::analyze_concurrency(sm).empty());
  }
  {
    const SourceManager sm("void f() { synchronized (l) { h.sendMessageAtTime (m, t); } }");
    const auto warnings = java_lens::analyze_concurrency(sm);
    ASSERT_EQ(warnings.size(), 1U);
    EXPECT_EQ(warnings[0].hazard, ConcurrencyHazard::HandlerCallInLock);
  }
}

TEST(AnalysisConcurrency, ReferencesWithoutCallsAreIgnored)
{
  const SourceManager sm(
    "void f() { synchronized (l) { Runnable t = this::transact; int post = 1; } }");
  EXPECT_TRUE(java_lens::analyze_concurrency(sm).empty());
}

TEST(AnalysisConcurrency, UnterminatedBlockIsSkipped)
{
  const SourceManager sm("void f() { synchronized (l) { b.transact(1);");
  EXPECT_TRUE(java_lens::find_synchronized_blocks(sm).empty());
  EXPECT_TRUE(java_lens::analyze_concurrency(sm).empty());
}

TEST(AnalysisConcurrency, IdentifiersContainingTheKeywordAreNotLocks)
{
  const SourceManager sm("void f() { unsynchronized_call(); isSynchronized = true; }");
  EXPECT_TRUE(java_lens::find_synchronized_blocks(sm).empty());
}

TEST(AnalysisConcurrency, ReportsDiagnosticsWithCodesAndHelp)
{
  const SourceManager sm(
    "void f() { synchronized (l) { b.transact(1); h.post(r); synchronized (m) {} } }");
  java_lens::DiagnosticBag diags;
  java_lens::report_concurrency_warnings(java_lens::analyze_concurrency(sm), diags);

  ASSERT_EQ(diags.size(), 3U);
  const auto & all = diags.all();
  EXPECT_EQ(all[0].code, java_lens::k_code_binder_in_lock);
  EXPECT_EQ(all[1].code, java_lens::k_code_handler_in_lock);
  EXPECT_EQ(all[2].code, java_lens::k_code_nested_lock);
  for (const auto & d : all) {
    EXPECT_EQ(d.severity, java_lens::Severity::Warning);
    ASSERT_NE(d.primary_label(), nullptr);
    EXPECT_EQ(d.primary_label()->message, "lock taken here");
  }
  ASSERT_TRUE(all[0].help_message.has_value());
  EXPECT_EQ(*all[0].help_message, "move the binder call outside the synchronized block");
  ASSERT_TRUE(all[1].help_message.has_value());
  EXPECT_EQ(*all[1].help_message, "post or send the message after releasing the lock");
  EXPECT_FALSE(all[2].help_message.has_value());
}
