#include "CharToKeys.h"

#include <initializer_list>

namespace CharMappings {

const CharToKeys letters = {
  {'a', KeyEvent(Key::Key_A)}, {'A', KeyEvent::shifted(Key::Key_A)},
  {'b', KeyEvent(Key::Key_B)}, {'B', KeyEvent::shifted(Key::Key_B)},
  {'c', KeyEvent(Key::Key_C)}, {'C', KeyEvent::shifted(Key::Key_C)},
  {'d', KeyEvent(Key::Key_D)}, {'D', KeyEvent::shifted(Key::Key_D)},
  {'e', KeyEvent(Key::Key_E)}, {'E', KeyEvent::shifted(Key::Key_E)},
  {'f', KeyEvent(Key::Key_F)}, {'F', KeyEvent::shifted(Key::Key_F)},
  {'g', KeyEvent(Key::Key_G)}, {'G', KeyEvent::shifted(Key::Key_G)},
  {'h', KeyEvent(Key::Key_H)}, {'H', KeyEvent::shifted(Key::Key_H)},
  {'i', KeyEvent(Key::Key_I)}, {'I', KeyEvent::shifted(Key::Key_I)},
  {'j', KeyEvent(Key::Key_J)}, {'J', KeyEvent::shifted(Key::Key_J)},
  {'k', KeyEvent(Key::Key_K)}, {'K', KeyEvent::shifted(Key::Key_K)},
  {'l', KeyEvent(Key::Key_L)}, {'L', KeyEvent::shifted(Key::Key_L)},
  {'m', KeyEvent(Key::Key_M)}, {'M', KeyEvent::shifted(Key::Key_M)},
  {'n', KeyEvent(Key::Key_N)}, {'N', KeyEvent::shifted(Key::Key_N)},
  {'o', KeyEvent(Key::Key_O)}, {'O', KeyEvent::shifted(Key::Key_O)},
  {'p', KeyEvent(Key::Key_P)}, {'P', KeyEvent::shifted(Key::Key_P)},
  {'q', KeyEvent(Key::Key_Q)}, {'Q', KeyEvent::shifted(Key::Key_Q)},
  {'r', KeyEvent(Key::Key_R)}, {'R', KeyEvent::shifted(Key::Key_R)},
  {'s', KeyEvent(Key::Key_S)}, {'S', KeyEvent::shifted(Key::Key_S)},
  {'t', KeyEvent(Key::Key_T)}, {'T', KeyEvent::shifted(Key::Key_T)},
  {'u', KeyEvent(Key::Key_U)}, {'U', KeyEvent::shifted(Key::Key_U)},
  {'v', KeyEvent(Key::Key_V)}, {'V', KeyEvent::shifted(Key::Key_V)},
  {'w', KeyEvent(Key::Key_W)}, {'W', KeyEvent::shifted(Key::Key_W)},
  {'x', KeyEvent(Key::Key_X)}, {'X', KeyEvent::shifted(Key::Key_X)},
  {'y', KeyEvent(Key::Key_Y)}, {'Y', KeyEvent::shifted(Key::Key_Y)},
  {'z', KeyEvent(Key::Key_Z)}, {'Z', KeyEvent::shifted(Key::Key_Z)},
};

const CharToKeys digits = {
  {'0', KeyEvent(Key::Key_0)},
  {'1', KeyEvent(Key::Key_1)},
  {'2', KeyEvent(Key::Key_2)},
  {'3', KeyEvent(Key::Key_3)},
  {'4', KeyEvent(Key::Key_4)},
  {'5', KeyEvent(Key::Key_5)},
  {'6', KeyEvent(Key::Key_6)},
  {'7', KeyEvent(Key::Key_7)},
  {'8', KeyEvent(Key::Key_8)},
  {'9', KeyEvent(Key::Key_9)},
};

const CharToKeys whitespace = {
  {' ',  KeyEvent(Key::Key_Space)},
};

const CharToKeys topPunctuation = {
  {'`', KeyEvent(Key::Key_Grave)},      {'~', KeyEvent::shifted(Key::Key_Grave)},
  {'-', KeyEvent(Key::Key_Minus)},      {'_', KeyEvent::shifted(Key::Key_Minus)},
  {'=', KeyEvent(Key::Key_Equal)},      {'+', KeyEvent::shifted(Key::Key_Equal)},
  {'[', KeyEvent(Key::Key_LBracket)},   {'{', KeyEvent::shifted(Key::Key_LBracket)},
  {']', KeyEvent(Key::Key_RBracket)},   {'}', KeyEvent::shifted(Key::Key_RBracket)},
  {'\\', KeyEvent(Key::Key_Backslash)}, {'|', KeyEvent::shifted(Key::Key_Backslash)},
};

const CharToKeys mainPunctuation = {
  {';', KeyEvent(Key::Key_Semicolon)},   {':', KeyEvent::shifted(Key::Key_Semicolon)},
  {'\'', KeyEvent(Key::Key_Apostrophe)}, {'"', KeyEvent::shifted(Key::Key_Apostrophe)},
  {',', KeyEvent(Key::Key_Comma)},       {'<', KeyEvent::shifted(Key::Key_Comma)},
  {'.', KeyEvent(Key::Key_Period)},      {'>', KeyEvent::shifted(Key::Key_Period)},
  {'/', KeyEvent(Key::Key_Slash)},       {'?', KeyEvent::shifted(Key::Key_Slash)},
};

const CharToKeys digitSymbols = {
  {'!', KeyEvent::shifted(Key::Key_1)},
  {'@', KeyEvent::shifted(Key::Key_2)},
  {'#', KeyEvent::shifted(Key::Key_3)},
  {'$', KeyEvent::shifted(Key::Key_4)},
  {'%', KeyEvent::shifted(Key::Key_5)},
  {'^', KeyEvent::shifted(Key::Key_6)},
  {'&', KeyEvent::shifted(Key::Key_7)},
  {'*', KeyEvent::shifted(Key::Key_8)},
  {'(', KeyEvent::shifted(Key::Key_9)},
  {')', KeyEvent::shifted(Key::Key_0)},
};

// Helper to merge CharToKeys maps
static CharToKeys merge(std::initializer_list<const CharToKeys*> maps) {
  CharToKeys result;
  for (const auto* m : maps) {
    result.insert(m->begin(), m->end());
  }
  return result;
}

} // namespace CharMappings

// Global CHAR_TO_KEYS combining all character categories
const CharToKeys CHAR_TO_KEYS = CharMappings::merge({
  &CharMappings::letters,
  &CharMappings::digits,
  &CharMappings::whitespace,
  &CharMappings::topPunctuation,
  &CharMappings::mainPunctuation,
  &CharMappings::digitSymbols,
});
