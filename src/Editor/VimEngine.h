#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "Action.h"
#include "CommandLine.h"
#include "Config.h"
#include "CursorState.h"
#include "Mode.h"
#include "OperatorPending.h"
#include "Register.h"
#include "SuppressionToken.h"
#include "TextBuffer.h"
#include "Keyboard/InputEvent.h"

enum class OpenAt : std::uint8_t { Start, End };

// The modal editor. Owns the document, cursor, register, pending operator
// and command line, and routes each host event to the handler for the
// current mode. Never performs I/O: saving and closing are returned to the
// host as HostAction values.
//
// Key events and text events are separate, as a GUI toolkit delivers them.
// Letter keys drive Normal mode; in Insert and Command mode they are
// reported not-consumed and the matching text event does the typing.
class VimEngine {
public:
  explicit VimEngine(Config config = Config::standard());
  // Throws std::runtime_error if document is not valid UTF-8.
  explicit VimEngine(std::string document, Config config = Config::standard());

  DispatchResult handleKey(const KeyEvent& ev);
  DispatchResult handleText(std::string_view text);
  DispatchResult handle(const InputEvent& ev);

  // Replace the document. Cursor goes to 0, pending state is cleared, the
  // register survives. Throws std::runtime_error on invalid UTF-8 (and
  // leaves the engine untouched).
  void loadDocument(std::string text);

  void setMode(Mode mode);
  // Throws std::runtime_error if offset is past the end or not on a
  // codepoint boundary.
  void setCursor(std::size_t offset);

  // The host's "open note" gesture: cursor to the start or end, Insert
  // mode, and the key that triggered it will not be typed.
  void openForEditing(OpenAt at);

  // Queries
  Mode mode() const { return mode_; }
  std::string modeLabel() const;
  std::size_t line() const { return pos_.line; }
  std::size_t column() const { return pos_.col; }
  const CursorState& cursor() const { return pos_; }
  const std::string& text() const { return buf_.str(); }
  const TextBuffer& buffer() const { return buf_; }
  const std::string& registerContent() const { return reg_.content(); }
  const std::string& commandBuffer() const { return cmd_.buffer(); }
  Operator pendingOperator() const { return pending_.op(); }
  bool expectingInner() const { return pending_.expectingInner(); }
  bool suppressionArmed() const { return suppress_.armed(); }
  const Config& config() const { return config_; }

private:
  DispatchResult handleNormalKey(const KeyEvent& ev);
  DispatchResult handleInsertKey(const KeyEvent& ev);
  DispatchResult handleCommandKey(const KeyEvent& ev);

  // Feeds the pending operator. Returns true when the key was used up by
  // the operator grammar, false when it must be handled as a plain key.
  bool feedPending(const KeyEvent& ev);

  void switchMode(Mode to);

  Config config_;
  TextBuffer buf_;
  CursorState pos_;
  Mode mode_ = Mode::Normal;
  Register reg_;
  OperatorPending pending_;
  CommandLine cmd_;
  SuppressionToken suppress_;
};
