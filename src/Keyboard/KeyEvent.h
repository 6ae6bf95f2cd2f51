#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "XMacroKeyDefinitions.h"

static constexpr int KEY_COUNT = 59;

#define ENUM_VALUE(name, str) name,
enum class Key : int {
    VIMNOTE_KEYS(ENUM_VALUE)
    None
};
#undef ENUM_VALUE

static_assert(KEY_COUNT == static_cast<int>(Key::None), "key counts do not match");

struct Modifiers {
  bool shift = false;
  bool ctrl = false;
  bool alt = false;

  bool operator==(const Modifiers& other) const {
    return shift == other.shift && ctrl == other.ctrl && alt == other.alt;
  }
};

// A logical key press as the host's input system reports it. Character
// entry arrives separately as text (see VimEngine::handleText).
struct KeyEvent {
  Key key = Key::None;
  Modifiers mods{};

  KeyEvent() = default;
  KeyEvent(Key k, Modifiers m = {}) : key(k), mods(m) {}

  static KeyEvent shifted(Key k) { return KeyEvent(k, Modifiers{true, false, false}); }

  bool operator==(const KeyEvent& other) const {
    return key == other.key && mods == other.mods;
  }
};

// Name from VIMNOTE_KEYS ("Esc", "A", ...), "None" for Key::None.
const char* keyName(Key key);

// Inverse of keyName. Case-sensitive.
std::optional<Key> keyFromName(std::string_view name);
