#pragma once

#include <cstddef>

#include "TextBuffer.h"

// Cursor as a byte offset into the document.
//
// line/col are derived from offset and the buffer, never set directly.
// targetCol is the sticky column used by vertical motions (j/k): horizontal
// motions and edits overwrite it, vertical motions leave it alone.
struct CursorState {
  std::size_t offset = 0;
  std::size_t line = 0;
  std::size_t col = 0;
  std::size_t targetCol = 0;

  CursorState() = default;

  // Recompute line/col from offset. targetCol is untouched.
  void sync(const TextBuffer& buf) {
    offset = buf.clamp(offset);
    line = buf.lineIndex(offset);
    col = buf.column(offset);
  }

  // Horizontal move or edit: position and resync the sticky column.
  void setOffset(std::size_t off, const TextBuffer& buf) {
    offset = off;
    sync(buf);
    targetCol = col;
  }

  // Vertical move: position without disturbing the sticky column.
  void setOffsetKeepTarget(std::size_t off, const TextBuffer& buf) {
    offset = off;
    sync(buf);
  }

  bool operator==(const CursorState& other) const {
    return offset == other.offset && line == other.line && col == other.col &&
           targetCol == other.targetCol;
  }
  bool operator!=(const CursorState& other) const {
    return !(*this == other);
  }
};
