#pragma once

#include <cstddef>
#include <optional>

class TextBuffer;
struct CursorState;

// Motion resolution over a TextBuffer.
/*
* bool isBlank(char32_t c);
* bool isWordChar(char32_t c);
*
* size_t skipNonBlank(buf, off);   size_t skipBlank(buf, off);
* size_t nextWordStart(buf, off);  size_t prevWordStart(buf, off);
* optional<size_t> positionOnNextLine(buf, off, targetCol);
* optional<size_t> positionOnPrevLine(buf, off, targetCol);
*/
// The pure helpers take and return byte offsets; the motion* functions
// apply them to a CursorState with the right sticky-column behaviour.

struct VimUtils {
  // Classification
  static bool isBlank(char32_t c);
  static bool isWordChar(char32_t c);

  // Word boundaries
  static std::size_t skipNonBlank(const TextBuffer &buf, std::size_t off);
  static std::size_t skipBlank(const TextBuffer &buf, std::size_t off);
  static std::size_t nextWordStart(const TextBuffer &buf, std::size_t off);
  static std::size_t prevWordStart(const TextBuffer &buf, std::size_t off);

  // Vertical targets. nullopt on the first/last line.
  static std::optional<std::size_t> positionOnNextLine(const TextBuffer &buf,
                                                       std::size_t off,
                                                       std::size_t targetCol);
  static std::optional<std::size_t> positionOnPrevLine(const TextBuffer &buf,
                                                       std::size_t off,
                                                       std::size_t targetCol);

  // Fundamental movements
  static void moveCol(CursorState &pos, const TextBuffer &buf, int dx);
  static void moveLine(CursorState &pos, const TextBuffer &buf, int dy);

  // Word motions
  static void motionW(CursorState &pos, const TextBuffer &buf);
  static void motionB(CursorState &pos, const TextBuffer &buf);

  // Line motions (0 and $)
  static void motionLineStart(CursorState &pos, const TextBuffer &buf);
  static void motionLineEnd(CursorState &pos, const TextBuffer &buf);
};
