#include "CommandLine.h"

#include "Utils/Debug.h"
#include "Utils/StringUtils.h"
#include "Utils/Utf8.h"

using namespace std;

void CommandLine::open() {
  buffer_ = ":";
}

void CommandLine::close() {
  buffer_.clear();
}

void CommandLine::append(string_view text) {
  if (!isOpen()) return;
  for (size_t i = 0; i < text.size(); i = Utf8::nextBoundary(text, i)) {
    char32_t c = Utf8::decodeAt(text, i);
    if (c >= U' ' && c != 0x7F) {
      buffer_ += text.substr(i, Utf8::nextBoundary(text, i) - i);
    }
  }
}

void CommandLine::backspace() {
  if (buffer_.size() > 1) {
    buffer_.erase(Utf8::prevBoundary(buffer_, buffer_.size()));
  }
}

optional<HostAction> CommandLine::submit() {
  optional<HostAction> action = parse(buffer_);
  if (action) {
    debug(actionName(*action), "command received");
  } else {
    debug("unknown command", quotedPrintable(buffer_));
  }
  close();
  return action;
}

optional<HostAction> CommandLine::parse(string_view line) {
  if (line == ":w") return HostAction::Save;
  if (line == ":q") return HostAction::Quit;
  if (line == ":wq") return HostAction::SaveQuit;
  return nullopt;
}
