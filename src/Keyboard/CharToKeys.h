#pragma once

#include <unordered_map>
#include "KeyEvent.h"

// Single-character to key press mapping (US layout), used to turn typed
// characters into the key event a host would report alongside the text.
using CharToKeys = std::unordered_map<char, KeyEvent>;

// All printable ASCII characters mapped to their key press
extern const CharToKeys CHAR_TO_KEYS;

// Building blocks for character categories
namespace CharMappings {

// Letters (a-z, A-Z)
extern const CharToKeys letters;

// Digits (0-9)
extern const CharToKeys digits;

// Whitespace (space only; tab/newline are spelled <Tab>/<CR>)
extern const CharToKeys whitespace;

// Punctuation from top row (`, ~, -, _, =, +, [, {, ], }, \, |)
extern const CharToKeys topPunctuation;

// Main punctuation (; : ' " , < . > / ?)
extern const CharToKeys mainPunctuation;

// Symbols above digits (! @ # $ % ^ & * ( ))
extern const CharToKeys digitSymbols;

} // namespace CharMappings
