// tests/Actions/PasteTest.cpp

#include <gtest/gtest.h>

#include "Utils/TestUtils.h"

using namespace std;

// =============================================================================
// Paste Test Suite - p / P, linewise and charwise
// =============================================================================

class PasteTest : public ::testing::Test {
protected:
  static VimEngine run(const string& text, size_t offset, const string& keys) {
    VimEngine engine = makeEngine(text, offset);
    feed(engine, keys);
    return engine;
  }

  static void expectState(const VimEngine& engine, const string& text, size_t offset,
                          const string& msg = "") {
    EXPECT_EQ(engine.text(), text) << msg << " (text)";
    EXPECT_EQ(engine.cursor().offset, offset) << msg << " (offset)";
    EXPECT_EQ(engine.mode(), Mode::Normal) << msg << " (mode)";
  }
};

// =============================================================================
// 1. LINEWISE
// =============================================================================

TEST_F(PasteTest, YYP_DuplicatesLineBelow) {
  VimEngine engine = run("one\ntwo\nthree", 5, "yyp");
  expectState(engine, "one\ntwo\ntwo\nthree", 12, "cursor just past the pasted line");
  EXPECT_EQ(engine.registerContent(), "two\n") << "paste leaves the register alone";
}

TEST_F(PasteTest, YYShiftP_DuplicatesLineAbove) {
  VimEngine engine = run("one\ntwo\nthree", 5, "yyP");
  expectState(engine, "one\ntwo\ntwo\nthree", 8);
}

TEST_F(PasteTest, YYP_OnLastLineWithoutTerminator) {
  VimEngine engine = run("one\ntwo", 5, "yyp");
  expectState(engine, "one\ntwo\ntwo", 11, "exactly one line added");
}

TEST_F(PasteTest, YYP_SingleLineDocument) {
  VimEngine engine = run("hello", 0, "yyp");
  expectState(engine, "hello\nhello", 11);
}

TEST_F(PasteTest, DDP_MovesLineDown) {
  VimEngine engine = run("one\ntwo\nthree", 0, "ddp");
  expectState(engine, "two\none\nthree", 8);
}

TEST_F(PasteTest, SecondPasteGoesBelowTheLineAfterTheFirst) {
  // The first p leaves the cursor on "b", so the second copy lands under it
  VimEngine engine = run("a\nb\n", 0, "yypp");
  expectState(engine, "a\na\nb\na\n", 8);
}

// =============================================================================
// 2. CHARWISE
// =============================================================================

TEST_F(PasteTest, P_InsertsAfterCursorCodepoint) {
  VimEngine engine = run("hello world", 0, "yiwwp");
  // cursor on 'w' (6); "hello" goes after it
  expectState(engine, "hello whelloorld", 12);
  EXPECT_EQ(engine.registerContent(), "hello");
}

TEST_F(PasteTest, ShiftP_InsertsAtCursor) {
  VimEngine engine = run("hello world", 0, "yiwwP");
  expectState(engine, "hello helloworld", 11);
}

TEST_F(PasteTest, P_AfterMultiByteCodepoint) {
  // Register "x", cursor on é: paste lands after both of its bytes
  VimEngine engine = run("x\xC3\xA9", 0, "yl");
  ASSERT_TRUE(engine.registerContent().empty()) << "yl is not a valid operator";

  engine = makeEngine("x \xC3\xA9", 0);
  feed(engine, "yiwllp");
  expectState(engine, "x \xC3\xA9x", 5);
}

TEST_F(PasteTest, P_AtEndOfDocumentInsertsAtCursor) {
  VimEngine engine = makeEngine("ab", 0);
  feed(engine, "yiw");
  engine.setCursor(2);
  feed(engine, "p");
  expectState(engine, "abab", 4);
}

TEST_F(PasteTest, P_OnLineTerminatorInsertsAfterIt) {
  VimEngine engine = makeEngine("ab\ncd", 0);
  feed(engine, "yiw$p");
  expectState(engine, "ab\nabcd", 5, "text goes to the start of the next line");
}

TEST_F(PasteTest, ShiftP_OnLineTerminatorInsertsBeforeIt) {
  VimEngine engine = makeEngine("ab\ncd", 0);
  feed(engine, "yiw$P");
  expectState(engine, "abab\ncd", 4);
}

TEST_F(PasteTest, P_WithEmptyRegisterIsNoOp) {
  VimEngine engine = run("hello", 2, "p");
  expectState(engine, "hello", 2);
  engine = run("hello", 2, "P");
  expectState(engine, "hello", 2);
}

TEST_F(PasteTest, RegisterSurvivesDocumentLoad) {
  VimEngine engine = run("keep me", 0, "yiw");
  engine.loadDocument("new note");
  feed(engine, "P");
  expectState(engine, "keepnew note", 4);
}
