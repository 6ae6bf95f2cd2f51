#pragma once

#include <string_view>

#include "Editor/CursorState.h"
#include "Editor/Range.h"
#include "Editor/TextBuffer.h"

// Edit operations that modify buffer content.
//
// Design principles:
// - Assume valid state (offsets on boundaries; asserted in TextBuffer)
// - Never fail: no-op at the document edges instead of throwing
// - Every edit resyncs the cursor's sticky column

namespace VimEditUtils {

// -----------------------------------------------------------------------------
// Span operations
// -----------------------------------------------------------------------------

// Delete text in range and update pos.
// For charwise: pos goes to the start of the deleted range.
// For linewise: the line and its '\n' go; on a last line without '\n' the
// preceding '\n' goes instead. pos goes to the start of the line now at
// range.start (clamped to the end of the buffer).
void deleteRange(TextBuffer& buf, const Range& range, CursorState& pos);

// Insert text at pos; pos ends up just past it.
void insertText(TextBuffer& buf, CursorState& pos, std::string_view text);

// -----------------------------------------------------------------------------
// Single-codepoint operations
// -----------------------------------------------------------------------------

// x / <Del> - remove the codepoint under pos. No-op at end of buffer.
void deleteCharAt(TextBuffer& buf, CursorState& pos);

// <BS> - remove the codepoint before pos. No-op at offset 0.
void deleteCharBefore(TextBuffer& buf, CursorState& pos);

// -----------------------------------------------------------------------------
// Line operations
// -----------------------------------------------------------------------------

// o - open new line below current, pos moves to the new line
void openLineBelow(TextBuffer& buf, CursorState& pos);

// O - open new line above current, pos moves to the new line
void openLineAbove(TextBuffer& buf, CursorState& pos);

// -----------------------------------------------------------------------------
// Paste
// -----------------------------------------------------------------------------

// p/P with text containing '\n'. Below inserts after the current line's
// terminator; above inserts at the start of the current line.
void pasteLinewise(TextBuffer& buf, CursorState& pos, std::string_view text, bool above);

// p/P with single-line text. After inserts past the codepoint under pos;
// before inserts at pos.
void pasteCharwise(TextBuffer& buf, CursorState& pos, std::string_view text, bool before);

} // namespace VimEditUtils
