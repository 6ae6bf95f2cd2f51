#include "Config.h"

#include <algorithm>

#include "Utils/Debug.h"

using namespace std;

static bool anyMatch(const vector<KeyChord>& chords, const KeyEvent& ev) {
  return any_of(chords.begin(), chords.end(),
                [&](const KeyChord& c) { return c.matches(ev); });
}

// ---------------------------------------------------------------------------
// US layout, as vim spells it
//   :  = Shift + Semicolon
//   $  = Shift + 4
// ---------------------------------------------------------------------------
Config Config::standard() {
  Config c;
  c.enterCommand = {KeyChord(Key::Key_Semicolon, ShiftRule::Required)};
  c.lineEnd = {KeyChord(Key::Key_4, ShiftRule::Required)};
  debug("config: standard keymap");
  return c;
}

// ---------------------------------------------------------------------------
// The desktop notes host: its key events drop the shifted symbol, so it
// binds command mode to Shift + 9 and end of line to the bare 4 key.
// ":" is kept as well so either spelling works.
// ---------------------------------------------------------------------------
Config Config::eguiHost() {
  Config c;
  c.enterCommand = {
    KeyChord(Key::Key_9, ShiftRule::Required),
    KeyChord(Key::Key_Semicolon, ShiftRule::Required),
  };
  c.lineEnd = {KeyChord(Key::Key_4, ShiftRule::Any)};
  debug("config: egui host keymap");
  return c;
}

bool Config::isEnterCommand(const KeyEvent& ev) const {
  return anyMatch(enterCommand, ev);
}

bool Config::isLineEnd(const KeyEvent& ev) const {
  return anyMatch(lineEnd, ev);
}
