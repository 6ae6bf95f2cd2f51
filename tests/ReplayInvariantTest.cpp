#include <gtest/gtest.h>

#include "Editor/Replay.h"
#include "Utils/TestUtils.h"

using namespace std;

// =============================================================================
// Replay - scripted sessions, and random sessions checked against the
// cursor invariants after every event
// =============================================================================

class ReplayInvariantTest : public ::testing::Test {
protected:
  // Tokens a user could type; multi-byte text included on purpose
  static const vector<string>& alphabet() {
    static const vector<string> tokens = {
      "h", "j", "k", "l", "w", "b", "0", "$", "x",
      "i", "a", "I", "A", "o", "O", "p", "P",
      "d", "y", "c", "dd", "yy", "cc", "dw", "diw", "ciw",
      "<Esc>", "<CR>", "<BS>", "<Del>", "<Tab>",
      "<Left>", "<Right>", "<Up>", "<Down>", "<Home>", "<End>",
      "e", " ", ":", "q", "\xC3\xA9", "\xE6\x97\xA5", "\xF0\x9F\x98\x80",
    };
    return tokens;
  }

  static string randomKeys(mt19937& rng, size_t count) {
    const auto& tokens = alphabet();
    uniform_int_distribution<size_t> pick(0, tokens.size() - 1);
    string keys;
    for (size_t i = 0; i < count; i++) keys += tokens[pick(rng)];
    return keys;
  }

  static void expectInvariants(const VimEngine& engine, const string& context) {
    const TextBuffer& buf = engine.buffer();
    const CursorState& c = engine.cursor();
    ASSERT_LE(c.offset, buf.size()) << context;
    ASSERT_TRUE(buf.isBoundary(c.offset)) << context;
    EXPECT_EQ(c.line, buf.lineIndex(c.offset)) << context;
    EXPECT_EQ(c.col, buf.column(c.offset)) << context;
    EXPECT_EQ(engine.mode() == Mode::Command, !engine.commandBuffer().empty()) << context;
    if (engine.mode() == Mode::Command) {
      EXPECT_EQ(engine.commandBuffer()[0], ':') << context;
    }
    if (engine.mode() != Mode::Normal) {
      EXPECT_EQ(engine.pendingOperator(), Operator::None) << context;
    }
  }
};

TEST_F(ReplayInvariantTest, RandomSessionsKeepCursorOnBoundary) {
  mt19937 rng(20240611);
  const vector<string> starts = {
    "",
    "hello world",
    "one\ntwo\nthree\n",
    TestFiles::load("notes.txt"),
    TestFiles::load("unicode.txt"),
  };

  for (int round = 0; round < 200; round++) {
    VimEngine engine(starts[round % starts.size()]);
    string keys = randomKeys(rng, 60);
    auto events = globalTokenizer().tokenize(keys);

    for (size_t i = 0; i < events.size(); i++) {
      engine.handle(events[i]);
      expectInvariants(engine, "round " + to_string(round) + " event " +
                                   to_string(i) + " keys " + quotedPrintable(keys));
      if (HasFatalFailure()) return;
    }
  }
}

TEST_F(ReplayInvariantTest, ReplayStopsOnQuitAndSavesOnWrite) {
  VimEngine engine;
  vector<string> saved;
  ReplayResult result = replay(engine, "ihi<Esc>:w<CR>:q<CR>ix",
                               [&](const string& text) { saved.push_back(text); });

  EXPECT_TRUE(result.quit);
  EXPECT_EQ(result.actions, (vector<HostAction>{HostAction::Save, HostAction::Quit}));
  EXPECT_EQ(saved, vector<string>{"hi"});
  EXPECT_EQ(engine.text(), "hi") << "keys after :q are not played";
}

TEST_F(ReplayInvariantTest, SaveQuitSavesOnce) {
  VimEngine engine("draft");
  int saves = 0;
  ReplayResult result = replay(engine, "A!<Esc>:wq<CR>", [&](const string& text) {
    EXPECT_EQ(text, "draft!");
    saves++;
  });
  EXPECT_TRUE(result.quit);
  EXPECT_EQ(saves, 1);
}

TEST_F(ReplayInvariantTest, ReportShowsOneBasedPosition) {
  VimEngine engine;
  ReplayResult result = replay(engine, "ihi<CR>there<Esc>", nullptr);

  ostringstream os;
  printReport(os, engine, result);
  string report = os.str();
  EXPECT_NE(report.find("\"hi\\nthere\""), string::npos) << report;
  EXPECT_NE(report.find("cursor: 2:5"), string::npos) << report;
  EXPECT_NE(report.find("mode:   NORMAL"), string::npos) << report;
  EXPECT_NE(report.find("actions: (none)"), string::npos) << report;
}

TEST_F(ReplayInvariantTest, ReportEscapesControlCharacters) {
  VimEngine engine(string("a\tb\\c\nd"));
  ostringstream os;
  printReport(os, engine, ReplayResult{});
  EXPECT_NE(os.str().find("text:   \"a\\tb\\\\c\\nd\"\n"), string::npos) << os.str();
  EXPECT_EQ(quotedPrintable(string("x\ny")), "\"x\\ny\"");
}
