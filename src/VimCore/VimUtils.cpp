#include "VimUtils.h"

#include <algorithm>

#include <unicode/uchar.h>

#include "Editor/CursorState.h"
#include "Editor/TextBuffer.h"
#include "VimOptions.h"

using namespace std;


// -----------------------------------------------------------------------------
// Classification helpers
// -----------------------------------------------------------------------------

// Blank: Unicode White_Space (includes '\n', so word motions cross lines).
bool VimUtils::isBlank(char32_t c) {
  return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_WHITE_SPACE);
}

// Word character: Alphabetic or a numeric category (Nd, Nl, No), plus '_'.
bool VimUtils::isWordChar(char32_t c) {
  if (c < 0x80) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
  }
  if (VimOptions::asciiWordsOnly()) return false;
  UChar32 cp = static_cast<UChar32>(c);
  return u_hasBinaryProperty(cp, UCHAR_ALPHABETIC) ||
         (U_GET_GC_MASK(cp) & U_GC_N_MASK) != 0;
}

// -----------------------------------------------------------------------------
// Word boundaries
// -----------------------------------------------------------------------------

size_t VimUtils::skipNonBlank(const TextBuffer &buf, size_t off) {
  while (off < buf.size() && !isBlank(buf.charAt(off))) {
    off = buf.next(off);
  }
  return off;
}

size_t VimUtils::skipBlank(const TextBuffer &buf, size_t off) {
  while (off < buf.size() && isBlank(buf.charAt(off))) {
    off = buf.next(off);
  }
  return off;
}

// End of the current non-blank run plus the blanks after it. This is both
// where w lands and the exclusive end of the dw/cw/yw span.
size_t VimUtils::nextWordStart(const TextBuffer &buf, size_t off) {
  return skipBlank(buf, skipNonBlank(buf, off));
}

size_t VimUtils::prevWordStart(const TextBuffer &buf, size_t off) {
  while (off > 0 && isBlank(buf.charAt(buf.prev(off)))) {
    off = buf.prev(off);
  }
  while (off > 0 && !isBlank(buf.charAt(buf.prev(off)))) {
    off = buf.prev(off);
  }
  return off;
}

// -----------------------------------------------------------------------------
// Vertical targets
// -----------------------------------------------------------------------------

optional<size_t> VimUtils::positionOnNextLine(const TextBuffer &buf, size_t off,
                                              size_t targetCol) {
  size_t end = buf.lineEnd(off);
  if (end >= buf.size()) return nullopt;
  size_t nextStart = end + 1;
  // Empty line (including the one after a trailing '\n') lands at its start
  return buf.offsetAtColumn(nextStart, targetCol);
}

optional<size_t> VimUtils::positionOnPrevLine(const TextBuffer &buf, size_t off,
                                              size_t targetCol) {
  size_t start = buf.lineStart(off);
  if (start == 0) return nullopt;
  size_t prevStart = buf.lineStart(start - 1);
  return buf.offsetAtColumn(prevStart, targetCol);
}

// -----------------------------------------------------------------------------
// Movements
// -----------------------------------------------------------------------------

void VimUtils::moveCol(CursorState &pos, const TextBuffer &buf, int dx) {
  size_t off = pos.offset;
  for (; dx < 0 && off > 0; ++dx) off = buf.prev(off);
  for (; dx > 0 && off < buf.size(); --dx) off = buf.next(off);
  pos.setOffset(off, buf);
}

// The sticky column survives any run of vertical moves: target is computed
// from it, and the landing column does not overwrite it.
void VimUtils::moveLine(CursorState &pos, const TextBuffer &buf, int dy) {
  size_t target = max(pos.targetCol, pos.col);
  size_t off = pos.offset;
  for (; dy > 0; --dy) {
    auto next = positionOnNextLine(buf, off, target);
    if (!next) break;
    off = *next;
  }
  for (; dy < 0; ++dy) {
    auto prev = positionOnPrevLine(buf, off, target);
    if (!prev) break;
    off = *prev;
  }
  pos.setOffsetKeepTarget(off, buf);
}

void VimUtils::motionW(CursorState &pos, const TextBuffer &buf) {
  if (pos.offset >= buf.size()) return;
  pos.setOffset(nextWordStart(buf, pos.offset), buf);
}

void VimUtils::motionB(CursorState &pos, const TextBuffer &buf) {
  if (pos.offset == 0) return;
  pos.setOffset(prevWordStart(buf, pos.offset), buf);
}

void VimUtils::motionLineStart(CursorState &pos, const TextBuffer &buf) {
  pos.setOffset(buf.lineStart(pos.offset), buf);
}

void VimUtils::motionLineEnd(CursorState &pos, const TextBuffer &buf) {
  pos.setOffset(buf.lineEnd(pos.offset), buf);
}
