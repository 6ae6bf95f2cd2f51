#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "Action.h"

// The ':' line. The buffer always starts with ':' while open and is empty
// while closed.
class CommandLine {
public:
  void open();
  void close();
  bool isOpen() const { return !buffer_.empty(); }

  // Appends codepoints >= U+0020; control characters are dropped.
  void append(std::string_view text);

  // Removes the last codepoint, never the leading ':'.
  void backspace();

  // Parses the buffer, then closes.
  std::optional<HostAction> submit();

  const std::string& buffer() const { return buffer_; }

  // Fixed vocabulary: ":w", ":q", ":wq". Anything else is no action.
  static std::optional<HostAction> parse(std::string_view line);

private:
  std::string buffer_;
};
