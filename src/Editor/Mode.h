#pragma once

#include <cstdint>

enum class Mode : std::uint8_t {
  Normal,
  Insert,
  Command,
};

inline const char* modeName(Mode mode) {
  switch (mode) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Command: return "COMMAND";
  }
  return "NORMAL";
}
