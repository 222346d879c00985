#include <gtest/gtest.h>

#include <string>

#include "java_lens/basic/source_manager.hpp"

using java_lens::SourceManager;
using java_lens::SourceRange;

TEST(BasicSourceManager, LineIndexStartsAtZeroAndFollowsNewlines)
{
  const auto starts = java_lens::build_line_index("ab\ncd\n\nef");
  ASSERT_EQ(starts.size(), 4U);
  EXPECT_EQ(starts[0], 0U);
  EXPECT_EQ(starts[1], 3U);
  EXPECT_EQ(starts[2], 6U);
  EXPECT_EQ(starts[3], 7U);
}

TEST(BasicSourceManager, OffsetToLineIsOneBased)
{
  const auto starts = java_lens::build_line_index("ab\ncd\n\nef");
  EXPECT_EQ(java_lens::offset_to_line(0, starts), 1U);
  EXPECT_EQ(java_lens::offset_to_line(2, starts), 1U);  // the '\n' itself
  EXPECT_EQ(java_lens::offset_to_line(3, starts), 2U);
  EXPECT_EQ(java_lens::offset_to_line(6, starts), 3U);
  EXPECT_EQ(java_lens::offset_to_line(8, starts), 4U);
  EXPECT_EQ(java_lens::offset_to_line(1000, starts), 4U);
}

TEST(BasicSourceManager, LineColumnAndLineText)
{
  const SourceManager sm("class A {\r\n  int x;\n}");

  const auto lc = sm.get_line_column(13);  // 'i' of int
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 3U);

  EXPECT_EQ(sm.get_line_text(0), "class A {");  // CR stripped
  EXPECT_EQ(sm.get_line_text(1), "  int x;");
  EXPECT_EQ(sm.get_line_text(2), "}");
  EXPECT_EQ(sm.get_line_text(3), "");
}

TEST(BasicSourceManager, FullRangeSpansLines)
{
  const SourceManager sm("int a;\nint b;\n");

  const auto fr = sm.get_full_range(SourceRange(4, 11));
  EXPECT_EQ(fr.start_line, 1U);
  EXPECT_EQ(fr.start_column, 5U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 5U);
  EXPECT_EQ(fr.start_byte, 4U);
  EXPECT_EQ(fr.end_byte, 11U);
}

TEST(BasicSourceManager, InvalidRangeHasNoPosition)
{
  const SourceManager sm("x");
  const SourceRange invalid;
  EXPECT_TRUE(invalid.is_invalid());
  EXPECT_FALSE(sm.get_full_range(invalid).is_valid());
}

TEST(BasicSourceManager, RangeEndNeverPrecedesStart)
{
  const SourceRange r(10, 4);
  EXPECT_EQ(r.get_begin().get_offset(), 10U);
  EXPECT_EQ(r.get_end().get_offset(), 10U);
  EXPECT_EQ(r.size(), 0U);
}
