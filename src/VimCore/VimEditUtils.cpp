#include "VimEditUtils.h"

#include <algorithm>
#include <cassert>
#include <string>

using namespace std;

namespace VimEditUtils {

// -----------------------------------------------------------------------------
// Span operations
// -----------------------------------------------------------------------------

void deleteRange(TextBuffer& buf, const Range& range, CursorState& pos) {
  assert(range.end <= buf.size());

  if (range.linewise) {
    size_t start = range.start;
    size_t end = range.end;
    // Last line without '\n': take the preceding '\n' so no empty line is left
    bool lastLine = end == buf.size() && (end == start || buf.str()[end - 1] != '\n');
    if (lastLine && start > 0) {
      --start;
    }
    if (start == end) {
      pos.setOffset(pos.offset, buf);
      return;
    }
    buf.erase(start, end);

    size_t landing = min(range.start, buf.size());
    pos.setOffset(buf.lineStart(landing), buf);
  } else {
    if (range.isEmpty()) {
      pos.setOffset(pos.offset, buf);
      return;
    }
    buf.erase(range.start, range.end);
    pos.setOffset(min(range.start, buf.size()), buf);
  }
}

void insertText(TextBuffer& buf, CursorState& pos, string_view text) {
  if (text.empty()) return;
  size_t at = buf.clamp(pos.offset);
  buf.insert(at, text);
  pos.setOffset(at + text.size(), buf);
}

// -----------------------------------------------------------------------------
// Single-codepoint operations
// -----------------------------------------------------------------------------

void deleteCharAt(TextBuffer& buf, CursorState& pos) {
  if (pos.offset >= buf.size()) return;
  buf.erase(pos.offset, buf.next(pos.offset));
  pos.setOffset(buf.clamp(pos.offset), buf);
}

void deleteCharBefore(TextBuffer& buf, CursorState& pos) {
  if (pos.offset == 0) return;
  size_t prev = buf.prev(pos.offset);
  buf.erase(prev, pos.offset);
  pos.setOffset(prev, buf);
}

// -----------------------------------------------------------------------------
// Line operations
// -----------------------------------------------------------------------------

void openLineBelow(TextBuffer& buf, CursorState& pos) {
  size_t end = buf.lineEnd(pos.offset);
  buf.insert(end, "\n");
  pos.setOffset(end + 1, buf);
}

void openLineAbove(TextBuffer& buf, CursorState& pos) {
  size_t start = buf.lineStart(pos.offset);
  buf.insert(start, "\n");
  pos.setOffset(start, buf);
  // pos.line stays the same (now points to the new empty line)
}

// -----------------------------------------------------------------------------
// Paste
// -----------------------------------------------------------------------------

void pasteLinewise(TextBuffer& buf, CursorState& pos, string_view text, bool above) {
  if (text.empty()) return;

  if (above) {
    size_t start = buf.lineStart(pos.offset);
    buf.insert(start, text);
    pos.setOffset(start + text.size(), buf);
    return;
  }

  size_t end = buf.lineEnd(pos.offset);
  if (end < buf.size()) {
    size_t at = end + 1;
    buf.insert(at, text);
    pos.setOffset(at + text.size(), buf);
    return;
  }

  // Last line has no terminator: supply one, drop the text's own trailing one
  string block = "\n";
  block += text;
  if (block.back() == '\n') block.pop_back();
  buf.insert(end, block);
  pos.setOffset(end + block.size(), buf);
}

void pasteCharwise(TextBuffer& buf, CursorState& pos, string_view text, bool before) {
  if (text.empty()) return;

  size_t at = buf.clamp(pos.offset);
  // After the codepoint under pos, including a '\n'; at end of buffer, at pos
  if (!before && at < buf.size()) {
    at = buf.next(at);
  }
  buf.insert(at, text);
  pos.setOffset(at + text.size(), buf);
}

} // namespace VimEditUtils
