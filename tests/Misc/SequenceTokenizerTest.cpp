#include <gtest/gtest.h>

#include "Keyboard/CharToKeys.h"
#include "Keyboard/SequenceTokenizer.h"

using namespace std;

// =============================================================================
// SequenceTokenizer - vim notation to host events
// =============================================================================

class SequenceTokenizerTest : public ::testing::Test {
protected:
  static vector<InputEvent> tokenize(string_view s) {
    return globalTokenizer().tokenize(s);
  }

  static void expectKey(const InputEvent& ev, Key key, bool shift = false) {
    ASSERT_TRUE(ev.isKey());
    EXPECT_EQ(ev.key.key, key) << keyName(ev.key.key) << " vs " << keyName(key);
    EXPECT_EQ(ev.key.mods.shift, shift) << keyName(key);
  }

  static void expectText(const InputEvent& ev, const string& text) {
    ASSERT_TRUE(ev.isText());
    EXPECT_EQ(ev.text, text);
  }
};

TEST_F(SequenceTokenizerTest, PlainCharacterIsKeyThenText) {
  auto events = tokenize("d");
  ASSERT_EQ(events.size(), 2u);
  expectKey(events[0], Key::Key_D);
  expectText(events[1], "d");
}

TEST_F(SequenceTokenizerTest, UppercaseAndSymbolsCarryShift) {
  auto events = tokenize("P:$");
  ASSERT_EQ(events.size(), 6u);
  expectKey(events[0], Key::Key_P, true);
  expectText(events[1], "P");
  expectKey(events[2], Key::Key_Semicolon, true);
  expectText(events[3], ":");
  expectKey(events[4], Key::Key_4, true);
  expectText(events[5], "$");
}

TEST_F(SequenceTokenizerTest, NamedKeysAreBareKeyEvents) {
  auto events = tokenize("<Esc><CR><BS><Del><Left><Right><Up><Down><Home><End>");
  ASSERT_EQ(events.size(), 10u);
  expectKey(events[0], Key::Key_Esc);
  expectKey(events[1], Key::Key_Enter);
  expectKey(events[2], Key::Key_Backspace);
  expectKey(events[3], Key::Key_Delete);
  expectKey(events[4], Key::Key_Left);
  expectKey(events[5], Key::Key_Right);
  expectKey(events[6], Key::Key_Up);
  expectKey(events[7], Key::Key_Down);
  expectKey(events[8], Key::Key_Home);
  expectKey(events[9], Key::Key_End);
}

TEST_F(SequenceTokenizerTest, LongestNameWins) {
  // <Enter> must not be read as <End> plus garbage
  auto events = tokenize("<Enter>");
  ASSERT_EQ(events.size(), 1u);
  expectKey(events[0], Key::Key_Enter);
}

TEST_F(SequenceTokenizerTest, TabAndSpaceCarryText) {
  auto events = tokenize("<Tab><Space>");
  ASSERT_EQ(events.size(), 4u);
  expectKey(events[0], Key::Key_Tab);
  expectText(events[1], "\t");
  expectKey(events[2], Key::Key_Space);
  expectText(events[3], " ");
}

TEST_F(SequenceTokenizerTest, LtIsALiteralLessThan) {
  auto events = tokenize("<lt>");
  ASSERT_EQ(events.size(), 2u);
  expectKey(events[0], Key::Key_Comma, true);
  expectText(events[1], "<");
}

TEST_F(SequenceTokenizerTest, NewlineIsEnter) {
  auto events = tokenize("a\nb");
  ASSERT_EQ(events.size(), 5u);
  expectKey(events[2], Key::Key_Enter);
}

TEST_F(SequenceTokenizerTest, MultiByteCharacterIsTextOnly) {
  auto events = tokenize("\xC3\xA9\xF0\x9F\x98\x80");
  ASSERT_EQ(events.size(), 2u);
  expectText(events[0], "\xC3\xA9");
  expectText(events[1], "\xF0\x9F\x98\x80");
}

TEST_F(SequenceTokenizerTest, CustomMapping) {
  SequenceTokenizer::Mapping named = {
    {"<Save>", {InputEvent::keyPress(KeyEvent::shifted(Key::Key_Semicolon)),
                InputEvent::textInput(":"),
                InputEvent::keyPress(KeyEvent(Key::Key_W)),
                InputEvent::textInput("w"),
                InputEvent::keyPress(KeyEvent(Key::Key_Enter))}},
  };
  SequenceTokenizer tokenizer(named);
  EXPECT_EQ(tokenizer.tokenize("<Save>").size(), 5u);
  EXPECT_THROW(tokenizer.tokenize("<Esc>"), runtime_error);
}

TEST(CharToKeysTest, CoversPrintableAscii) {
  for (char c = ' '; c <= '~'; c++) {
    EXPECT_TRUE(CHAR_TO_KEYS.contains(c)) << "missing '" << c << "'";
  }
  EXPECT_EQ(CHAR_TO_KEYS.at('a'), KeyEvent(Key::Key_A));
  EXPECT_EQ(CHAR_TO_KEYS.at('A'), KeyEvent::shifted(Key::Key_A));
  EXPECT_EQ(CHAR_TO_KEYS.at('('), KeyEvent::shifted(Key::Key_9));
  EXPECT_FALSE(CHAR_TO_KEYS.contains('\t'));
}

TEST(KeyEventTest, NamesRoundTrip) {
  EXPECT_STREQ(keyName(Key::Key_Esc), "Esc");
  EXPECT_EQ(keyFromName("Esc"), Key::Key_Esc);
  EXPECT_FALSE(keyFromName("esc").has_value()) << "case-sensitive";
  EXPECT_FALSE(keyFromName("F13").has_value());
}
