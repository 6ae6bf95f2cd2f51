#include "Edit.h"
#include "VimCore/VimEditUtils.h"
#include "VimCore/VimTextObjects.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"

#include <cassert>
#include <stdexcept>

using namespace std;

namespace Edit {

static void storeRegister(Register& reg, string text) {
  debug("register <-", quotedPrintable(text));
  reg.store(move(text));
}

// -----------------------------------------------------------------------------
// Operator + Range operations
// -----------------------------------------------------------------------------

string registerText(const TextBuffer& buf, const Range& range) {
  string text = buf.substr(range.start, range.end);
  if (range.linewise && (text.empty() || text.back() != '\n')) {
    text += '\n';
  }
  return text;
}

void deleteRange(TextBuffer& buf, CursorState& pos, Mode mode, Register& reg,
                 const Range& range) {
  assert(mode == Mode::Normal);
  // Empty word spans leave the register alone; a linewise span is never
  // "nothing", even on an empty line.
  if (range.isEmpty() && !range.linewise) {
    pos.setOffset(pos.offset, buf);
    return;
  }
  storeRegister(reg, registerText(buf, range));
  VimEditUtils::deleteRange(buf, range, pos);
}

void changeRange(TextBuffer& buf, CursorState& pos, Mode& mode, Register& reg,
                 const Range& range) {
  assert(mode == Mode::Normal);
  if (range.isEmpty()) {
    pos.setOffset(range.start, buf);
  } else {
    storeRegister(reg, registerText(buf, range));
    VimEditUtils::deleteRange(buf, range, pos);
  }
  mode = Mode::Insert;
}

void yankRange(const TextBuffer& buf, CursorState& pos, Mode mode, Register& reg,
               const Range& range) {
  assert(mode == Mode::Normal);
  if (!range.isEmpty() || range.linewise) {
    storeRegister(reg, registerText(buf, range));
  }
  // Cursor does not move; only the sticky column is resynced
  pos.setOffset(pos.offset, buf);
}

// -----------------------------------------------------------------------------
// Insert mode text insertion
// -----------------------------------------------------------------------------

void insertText(TextBuffer& buf, CursorState& pos, Mode mode, string_view text) {
  assert(mode == Mode::Insert);
  VimEditUtils::insertText(buf, pos, text);
}

// -----------------------------------------------------------------------------
// Application
// -----------------------------------------------------------------------------

static Range resolveTarget(const TextBuffer& buf, size_t off, Operator op,
                           OperatorTarget target) {
  switch (target) {
    case OperatorTarget::Line:
      // cc keeps the line slot, so it works on the content only
      return op == Operator::Change ? VimTextObjects::lineContent(buf, off)
                                    : VimTextObjects::currentLine(buf, off);
    case OperatorTarget::Word:
      return VimTextObjects::wordForward(buf, off);
    case OperatorTarget::InnerWord:
      return VimTextObjects::innerWord(buf, off);
  }
  throw runtime_error("Unknown operator target");
}

void applyOperator(TextBuffer& buf, CursorState& pos, Mode& mode, Register& reg,
                   Operator op, OperatorTarget target) {
  Range r = resolveTarget(buf, pos.offset, op, target);

  switch (op) {
    case Operator::Delete:
      deleteRange(buf, pos, mode, reg, r);
      return;
    case Operator::Yank:
      yankRange(buf, pos, mode, reg, r);
      return;
    case Operator::Change:
      // cc on an empty line still overwrites the register
      if (target == OperatorTarget::Line && r.isEmpty()) storeRegister(reg, "");
      changeRange(buf, pos, mode, reg, r);
      return;
    case Operator::None:
      break;
  }
  throw runtime_error("applyOperator called without an operator");
}

// -----------------------------------------------------------------------------
// Paste
// -----------------------------------------------------------------------------

void paste(TextBuffer& buf, CursorState& pos, const Register& reg, bool before) {
  if (reg.empty()) return;
  if (reg.isLinewise()) {
    VimEditUtils::pasteLinewise(buf, pos, reg.content(), before);
  } else {
    VimEditUtils::pasteCharwise(buf, pos, reg.content(), before);
  }
}

} // namespace Edit
