#pragma once

#include <cstddef>
#include <string_view>

// UTF-8 helpers. Offsets are byte offsets; a "boundary" is an offset in
// [0, s.size()] that does not point into the middle of an encoded codepoint.
//
// Everything except isValid()/firstInvalidByte() assumes the input is
// already valid UTF-8 (TextBuffer enforces this on load).

namespace Utf8 {

inline bool isContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Encoded length implied by a lead byte (1 for stray bytes).
inline std::size_t sequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

inline bool isBoundary(std::string_view s, std::size_t off) {
  if (off == s.size()) return true;
  if (off > s.size()) return false;
  return !isContinuation(static_cast<unsigned char>(s[off]));
}

// Offset of the codepoint after the one starting at off (s.size() at end).
std::size_t nextBoundary(std::string_view s, std::size_t off);

// Offset of the codepoint before off (0 at start).
std::size_t prevBoundary(std::string_view s, std::size_t off);

// Largest boundary <= off, after clamping off to s.size().
std::size_t floorBoundary(std::string_view s, std::size_t off);

// Codepoint starting at off, or 0 when off is at/after the end.
char32_t decodeAt(std::string_view s, std::size_t off);

// Strict validation: rejects overlong forms, surrogates and values above
// U+10FFFF. Returns std::string_view::npos when the whole string is valid.
std::size_t firstInvalidByte(std::string_view s);

inline bool isValid(std::string_view s) {
  return firstInvalidByte(s) == std::string_view::npos;
}

std::size_t countCodepoints(std::string_view s);

} // namespace Utf8
