#include "VimEngine.h"

#include <stdexcept>

#include "Edit.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"
#include "Utils/Utf8.h"
#include "VimCore/VimEditUtils.h"
#include "VimCore/VimUtils.h"

using namespace std;

VimEngine::VimEngine(Config config) : config_(move(config)) {}

VimEngine::VimEngine(string document, Config config)
  : config_(move(config)), buf_(move(document)) {
  pos_.setOffset(0, buf_);
}

// -----------------------------------------------------------------------------
// Host write surface
// -----------------------------------------------------------------------------

void VimEngine::loadDocument(string text) {
  TextBuffer loaded(move(text));
  buf_ = move(loaded);
  pos_ = CursorState();
  pos_.setOffset(0, buf_);
  pending_.reset();
  suppress_.discard();
  debug("document loaded,", buf_.size(), "bytes");
}

void VimEngine::setMode(Mode mode) {
  pending_.reset();
  switchMode(mode);
}

void VimEngine::setCursor(size_t offset) {
  if (offset > buf_.size()) {
    throw runtime_error("Cursor offset " + to_string(offset) +
                        " is past the end of the document (size " +
                        to_string(buf_.size()) + ")");
  }
  if (!buf_.isBoundary(offset)) {
    throw runtime_error("Cursor offset " + to_string(offset) +
                        " is inside a multi-byte character");
  }
  pos_.setOffset(offset, buf_);
}

void VimEngine::openForEditing(OpenAt at) {
  pending_.reset();
  pos_.setOffset(at == OpenAt::Start ? 0 : buf_.size(), buf_);
  switchMode(Mode::Insert);
  suppress_.arm();
}

void VimEngine::switchMode(Mode to) {
  if (to == mode_) return;
  debug("mode:", modeName(mode_), "->", modeName(to));
  if (mode_ == Mode::Command) cmd_.close();
  if (to == Mode::Command) cmd_.open();
  mode_ = to;
}

string VimEngine::modeLabel() const {
  switch (mode_) {
    case Mode::Normal:
      if (pending_.active()) return "NORMAL (" + pending_.label() + ")";
      return "NORMAL";
    case Mode::Insert:
      return "INSERT";
    case Mode::Command:
      return cmd_.buffer();
  }
  return "NORMAL";
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

DispatchResult VimEngine::handle(const InputEvent& ev) {
  return ev.isKey() ? handleKey(ev.key) : handleText(ev.text);
}

DispatchResult VimEngine::handleKey(const KeyEvent& ev) {
  // A token only covers the text of the key that armed it
  suppress_.discard();

  Mode before = mode_;
  DispatchResult result;
  switch (mode_) {
    case Mode::Normal: result = handleNormalKey(ev); break;
    case Mode::Insert: result = handleInsertKey(ev); break;
    case Mode::Command: result = handleCommandKey(ev); break;
  }

  if (before == Mode::Normal && mode_ != Mode::Normal) {
    suppress_.arm();
  }
  return result;
}

// Typed text: printable codepoints, newline and tab. Other control
// characters are dropped.
static string filterTyped(string_view text) {
  string out;
  for (size_t i = 0; i < text.size(); i = Utf8::nextBoundary(text, i)) {
    char32_t c = Utf8::decodeAt(text, i);
    if ((c >= U' ' && c != 0x7F) || c == U'\n' || c == U'\t') {
      out += text.substr(i, Utf8::nextBoundary(text, i) - i);
    }
  }
  return out;
}

DispatchResult VimEngine::handleText(string_view text) {
  if (suppress_.consume()) {
    debug("suppressed text", quotedPrintable(text));
    return DispatchResult(true);
  }
  size_t bad = Utf8::firstInvalidByte(text);
  if (bad != string_view::npos) {
    debug("dropped text input: invalid UTF-8 at byte", bad);
    return DispatchResult(false);
  }

  switch (mode_) {
    case Mode::Normal:
      return DispatchResult(false);
    case Mode::Insert:
      Edit::insertText(buf_, pos_, mode_, filterTyped(text));
      return DispatchResult(true);
    case Mode::Command:
      cmd_.append(text);
      return DispatchResult(true);
  }
  return DispatchResult(false);
}

// -----------------------------------------------------------------------------
// Normal mode
// -----------------------------------------------------------------------------

bool VimEngine::feedPending(const KeyEvent& ev) {
  OperatorPending::Step step = pending_.feed(ev.key);
  switch (step.kind) {
    case OperatorPending::Step::Kind::Wait:
      return true;
    case OperatorPending::Step::Kind::Complete: {
      Mode m = mode_;
      Edit::applyOperator(buf_, pos_, m, reg_, step.op, step.target);
      switchMode(m);
      return true;
    }
    case OperatorPending::Step::Kind::Abandon:
      debug("abandoned operator", operatorName(step.op), "on", keyName(ev.key));
      return false;
  }
  return false;
}

DispatchResult VimEngine::handleNormalKey(const KeyEvent& ev) {
  if (pending_.active() && feedPending(ev)) {
    return DispatchResult(true);
  }

  if (config_.isEnterCommand(ev)) {
    switchMode(Mode::Command);
    return DispatchResult(true);
  }
  if (config_.isLineEnd(ev)) {
    VimUtils::motionLineEnd(pos_, buf_);
    return DispatchResult(true);
  }

  Operator op = OperatorPending::operatorForKey(ev.key);
  if (op != Operator::None) {
    pending_.begin(op);
    return DispatchResult(true);
  }

  bool shift = ev.mods.shift;
  switch (ev.key) {
    case Key::Key_Esc:
      return DispatchResult(true);

    // --- Motions ---
    case Key::Key_H: case Key::Key_Left:
      VimUtils::moveCol(pos_, buf_, -1);
      return DispatchResult(true);
    case Key::Key_L: case Key::Key_Right:
      VimUtils::moveCol(pos_, buf_, 1);
      return DispatchResult(true);
    case Key::Key_K: case Key::Key_Up:
      VimUtils::moveLine(pos_, buf_, -1);
      return DispatchResult(true);
    case Key::Key_J: case Key::Key_Down:
      VimUtils::moveLine(pos_, buf_, 1);
      return DispatchResult(true);
    case Key::Key_W:
      VimUtils::motionW(pos_, buf_);
      return DispatchResult(true);
    case Key::Key_B:
      VimUtils::motionB(pos_, buf_);
      return DispatchResult(true);
    case Key::Key_0:
      VimUtils::motionLineStart(pos_, buf_);
      return DispatchResult(true);

    // --- Insert entry ---
    case Key::Key_I:
      if (shift) VimUtils::motionLineStart(pos_, buf_);
      switchMode(Mode::Insert);
      return DispatchResult(true);
    case Key::Key_A:
      if (shift) {
        VimUtils::motionLineEnd(pos_, buf_);
      } else {
        VimUtils::moveCol(pos_, buf_, 1);
      }
      switchMode(Mode::Insert);
      return DispatchResult(true);
    case Key::Key_O:
      if (shift) {
        VimEditUtils::openLineAbove(buf_, pos_);
      } else {
        VimEditUtils::openLineBelow(buf_, pos_);
      }
      switchMode(Mode::Insert);
      return DispatchResult(true);

    // --- Edits ---
    case Key::Key_X:
      VimEditUtils::deleteCharAt(buf_, pos_);
      return DispatchResult(true);
    case Key::Key_P:
      Edit::paste(buf_, pos_, reg_, shift);
      return DispatchResult(true);

    default:
      pos_.setOffset(pos_.offset, buf_);
      return DispatchResult(false);
  }
}

// -----------------------------------------------------------------------------
// Insert mode
// -----------------------------------------------------------------------------

DispatchResult VimEngine::handleInsertKey(const KeyEvent& ev) {
  switch (ev.key) {
    case Key::Key_Esc:
      if (pos_.offset > 0 && !buf_.empty()) {
        VimUtils::moveCol(pos_, buf_, -1);
      }
      switchMode(Mode::Normal);
      return DispatchResult(true);
    case Key::Key_Enter:
      Edit::insertText(buf_, pos_, mode_, "\n");
      return DispatchResult(true);
    case Key::Key_Backspace:
      VimEditUtils::deleteCharBefore(buf_, pos_);
      return DispatchResult(true);
    case Key::Key_Delete:
      VimEditUtils::deleteCharAt(buf_, pos_);
      return DispatchResult(true);
    case Key::Key_Left:
      VimUtils::moveCol(pos_, buf_, -1);
      return DispatchResult(true);
    case Key::Key_Right:
      VimUtils::moveCol(pos_, buf_, 1);
      return DispatchResult(true);
    case Key::Key_Up:
      VimUtils::moveLine(pos_, buf_, -1);
      return DispatchResult(true);
    case Key::Key_Down:
      VimUtils::moveLine(pos_, buf_, 1);
      return DispatchResult(true);
    case Key::Key_Home:
      pos_.setOffsetKeepTarget(buf_.lineStart(pos_.offset), buf_);
      return DispatchResult(true);
    case Key::Key_End:
      pos_.setOffsetKeepTarget(buf_.lineEnd(pos_.offset), buf_);
      return DispatchResult(true);
    default:
      // Typing arrives as text
      return DispatchResult(false);
  }
}

// -----------------------------------------------------------------------------
// Command mode
// -----------------------------------------------------------------------------

DispatchResult VimEngine::handleCommandKey(const KeyEvent& ev) {
  switch (ev.key) {
    case Key::Key_Esc:
      switchMode(Mode::Normal);
      return DispatchResult(true);
    case Key::Key_Enter: {
      optional<HostAction> action = cmd_.submit();
      switchMode(Mode::Normal);
      return DispatchResult(true, action);
    }
    case Key::Key_Backspace:
      cmd_.backspace();
      return DispatchResult(true);
    default:
      return DispatchResult(false);
  }
}
