#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// The document: UTF-8 text stored as one contiguous string.
//
// Lines are separated by '\n'. Offsets are byte offsets; every offset this
// class hands out is a codepoint boundary in [0, size()]. Mutators assert
// that callers pass boundaries (the engine clamps before calling them).
class TextBuffer {
public:
  TextBuffer() = default;

  // Throws std::runtime_error if text is not valid UTF-8.
  explicit TextBuffer(std::string text);

  const std::string& str() const { return text_; }
  std::size_t size() const { return text_.size(); }
  bool empty() const { return text_.empty(); }

  bool isBoundary(std::size_t off) const;

  // Codepoint at off, 0 at end of document.
  char32_t charAt(std::size_t off) const;
  std::size_t next(std::size_t off) const;
  std::size_t prev(std::size_t off) const;

  // Largest boundary <= min(off, size()).
  std::size_t clamp(std::size_t off) const;

  // Offset just after the '\n' preceding off (0 on the first line).
  std::size_t lineStart(std::size_t off) const;
  // Offset of the '\n' ending off's line, or size() on the last line.
  std::size_t lineEnd(std::size_t off) const;
  bool hasTerminator(std::size_t off) const { return lineEnd(off) < size(); }

  // Number of '\n' before off.
  std::size_t lineIndex(std::size_t off) const;
  // Codepoints between lineStart(off) and off.
  std::size_t column(std::size_t off) const;
  // Codepoints in the line containing off, terminator excluded.
  std::size_t lineLength(std::size_t off) const;

  // Offset of the col-th codepoint of the line starting at lineStartOff,
  // stopping at the line end if the line is shorter.
  std::size_t offsetAtColumn(std::size_t lineStartOff, std::size_t col) const;

  std::string substr(std::size_t start, std::size_t end) const;

  // text must be valid UTF-8 and off a boundary.
  void insert(std::size_t off, std::string_view text);
  // Removes [start, end) and returns the removed text.
  std::string erase(std::size_t start, std::size_t end);

private:
  std::string text_;
};
