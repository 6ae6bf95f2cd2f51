#pragma once

#include <cstdint>
#include <vector>

#include "Keyboard/KeyEvent.h"

// -----------------------------------------------------------------------------
// Key chords
// -----------------------------------------------------------------------------

enum class ShiftRule : std::uint8_t {
  Any,       // matches with or without shift
  Required,
  Forbidden,
};

struct KeyChord {
  Key key = Key::None;
  ShiftRule shift = ShiftRule::Forbidden;

  KeyChord() = default;
  KeyChord(Key k, ShiftRule s) : key(k), shift(s) {}

  bool matches(const KeyEvent& ev) const {
    if (ev.key != key) return false;
    switch (shift) {
      case ShiftRule::Any: return true;
      case ShiftRule::Required: return ev.mods.shift;
      case ShiftRule::Forbidden: return !ev.mods.shift;
    }
    return false;
  }
};

// Keys whose physical chord depends on the host. Everything else in the
// grammar (hjkl, w, b, d, y, c, ...) is fixed.
// Use factory pattern
struct Config {
  std::vector<KeyChord> enterCommand;  // ":" in vim
  std::vector<KeyChord> lineEnd;       // "$" in vim

  static Config standard();
  static Config eguiHost();

  bool isEnterCommand(const KeyEvent& ev) const;
  bool isLineEnd(const KeyEvent& ev) const;

private:
  Config() = default;
};
