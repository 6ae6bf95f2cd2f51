#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "KeyEvent.h"

// One discrete event from the host: either a key press or a chunk of
// entered text (one or more codepoints, UTF-8).
struct InputEvent {
  enum class Kind : std::uint8_t { Key, Text };

  Kind kind = Kind::Key;
  KeyEvent key{};
  std::string text;

  static InputEvent keyPress(KeyEvent k) {
    InputEvent e;
    e.kind = Kind::Key;
    e.key = k;
    return e;
  }

  static InputEvent textInput(std::string t) {
    InputEvent e;
    e.kind = Kind::Text;
    e.text = std::move(t);
    return e;
  }

  bool isKey() const { return kind == Kind::Key; }
  bool isText() const { return kind == Kind::Text; }
};
