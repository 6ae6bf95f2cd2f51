#pragma once

#include <string>
#include <string_view>

#include "CursorState.h"
#include "Mode.h"
#include "OperatorPending.h"
#include "Range.h"
#include "Register.h"
#include "TextBuffer.h"

// Edit operations that modify the buffer.
// All functions modify buf, pos (and mode/reg where given) in place.
namespace Edit {

// -----------------------------------------------------------------------------
// Operator + Range operations (d{range}, c{range}, y{range})
// Called with a pre-computed Range from a motion or text object.
// -----------------------------------------------------------------------------

// Text a span puts in the register. Linewise spans always end in '\n', even
// on a last line that has none, so pasting them stays linewise.
std::string registerText(const TextBuffer& buf, const Range& range);

// d{range} - delete range (Normal mode only)
void deleteRange(TextBuffer& buf, CursorState& pos, Mode mode, Register& reg,
                 const Range& range);

// c{range} - change range (Normal -> Insert, also for an empty range)
void changeRange(TextBuffer& buf, CursorState& pos, Mode& mode, Register& reg,
                 const Range& range);

// y{range} - yank range (Normal mode only, no buffer change)
void yankRange(const TextBuffer& buf, CursorState& pos, Mode mode, Register& reg,
               const Range& range);

// -----------------------------------------------------------------------------
// Insert mode text insertion
// -----------------------------------------------------------------------------

void insertText(TextBuffer& buf, CursorState& pos, Mode mode, std::string_view text);

// -----------------------------------------------------------------------------
// Operator dispatcher
// Resolves the target span at the cursor and applies op to it.
// -----------------------------------------------------------------------------

void applyOperator(TextBuffer& buf, CursorState& pos, Mode& mode, Register& reg,
                   Operator op, OperatorTarget target);

// -----------------------------------------------------------------------------
// p / P
// Linewise when the register holds a '\n'. No-op on an empty register.
// -----------------------------------------------------------------------------

void paste(TextBuffer& buf, CursorState& pos, const Register& reg, bool before);

} // namespace Edit
