#include <gtest/gtest.h>
#include <stdexcept>

#include "Editor/TextBuffer.h"

using namespace std;

// =============================================================================
// TextBuffer - line geometry over a UTF-8 document
// =============================================================================

class TextBufferTest : public ::testing::Test {
protected:
  // "ab\ncd\n": three lines, the last one empty
  TextBuffer twoLines{"ab\ncd\n"};
  // "héllo\nwörld": é and ö are two bytes each
  TextBuffer accented{"h\xC3\xA9llo\nw\xC3\xB6rld"};
};

TEST_F(TextBufferTest, RejectsInvalidUtf8) {
  EXPECT_THROW(TextBuffer("abc\xFF"), runtime_error);
  EXPECT_NO_THROW(TextBuffer(""));
}

TEST_F(TextBufferTest, LineStartAndEnd) {
  EXPECT_EQ(twoLines.lineStart(0), 0u);
  EXPECT_EQ(twoLines.lineEnd(0), 2u);
  EXPECT_EQ(twoLines.lineStart(2), 0u) << "the '\\n' belongs to its line";
  EXPECT_EQ(twoLines.lineStart(4), 3u);
  EXPECT_EQ(twoLines.lineEnd(3), 5u);
  EXPECT_EQ(twoLines.lineStart(6), 6u) << "empty line after trailing '\\n'";
  EXPECT_EQ(twoLines.lineEnd(6), 6u);
}

TEST_F(TextBufferTest, Terminators) {
  EXPECT_TRUE(twoLines.hasTerminator(0));
  EXPECT_TRUE(twoLines.hasTerminator(4));
  EXPECT_FALSE(twoLines.hasTerminator(6));
  EXPECT_FALSE(accented.hasTerminator(7));
}

TEST_F(TextBufferTest, LineIndex) {
  EXPECT_EQ(twoLines.lineIndex(0), 0u);
  EXPECT_EQ(twoLines.lineIndex(2), 0u);
  EXPECT_EQ(twoLines.lineIndex(3), 1u);
  EXPECT_EQ(twoLines.lineIndex(6), 2u);
}

TEST_F(TextBufferTest, ColumnsCountCodepoints) {
  // h(0) é(1,2) l(3)
  EXPECT_EQ(accented.column(3), 2u);
  EXPECT_EQ(accented.lineLength(0), 5u);
  // w(7) ö(8,9) r(10)
  EXPECT_EQ(accented.column(10), 2u);
  EXPECT_EQ(accented.lineLength(7), 5u);
}

TEST_F(TextBufferTest, OffsetAtColumn) {
  EXPECT_EQ(accented.offsetAtColumn(7, 0), 7u);
  EXPECT_EQ(accented.offsetAtColumn(7, 2), 10u);
  EXPECT_EQ(accented.offsetAtColumn(7, 99), accented.size()) << "stops at line end";
  EXPECT_EQ(accented.offsetAtColumn(0, 99), 6u) << "stops on the '\\n'";
}

TEST_F(TextBufferTest, StepAndClamp) {
  EXPECT_EQ(accented.next(1), 3u);
  EXPECT_EQ(accented.prev(3), 1u);
  EXPECT_EQ(accented.clamp(2), 1u);
  EXPECT_EQ(accented.clamp(1000), accented.size());
  EXPECT_EQ(accented.charAt(1), char32_t(0xE9));
  EXPECT_FALSE(accented.isBoundary(2));
}

TEST_F(TextBufferTest, InsertAndErase) {
  TextBuffer buf("hello world");
  buf.insert(5, ",");
  EXPECT_EQ(buf.str(), "hello, world");
  string removed = buf.erase(0, 7);
  EXPECT_EQ(removed, "hello, ");
  EXPECT_EQ(buf.str(), "world");
  EXPECT_EQ(buf.substr(1, 3), "or");
}
