#include "TextBuffer.h"

#include <algorithm>
#include <cassert>
#include <stdexcept>

#include "Utils/Utf8.h"

using namespace std;

TextBuffer::TextBuffer(string text) : text_(std::move(text)) {
  size_t bad = Utf8::firstInvalidByte(text_);
  if (bad != string_view::npos) {
    throw runtime_error("Document is not valid UTF-8 (byte " + to_string(bad) + ")");
  }
}

bool TextBuffer::isBoundary(size_t off) const {
  return Utf8::isBoundary(text_, off);
}

char32_t TextBuffer::charAt(size_t off) const {
  return Utf8::decodeAt(text_, off);
}

size_t TextBuffer::next(size_t off) const {
  return Utf8::nextBoundary(text_, off);
}

size_t TextBuffer::prev(size_t off) const {
  return Utf8::prevBoundary(text_, off);
}

size_t TextBuffer::clamp(size_t off) const {
  return Utf8::floorBoundary(text_, off);
}

size_t TextBuffer::lineStart(size_t off) const {
  off = min(off, text_.size());
  if (off == 0) return 0;
  size_t nl = text_.rfind('\n', off - 1);
  return nl == string::npos ? 0 : nl + 1;
}

size_t TextBuffer::lineEnd(size_t off) const {
  off = min(off, text_.size());
  size_t nl = text_.find('\n', off);
  return nl == string::npos ? text_.size() : nl;
}

size_t TextBuffer::lineIndex(size_t off) const {
  off = min(off, text_.size());
  return static_cast<size_t>(count(text_.begin(), text_.begin() + off, '\n'));
}

size_t TextBuffer::column(size_t off) const {
  off = min(off, text_.size());
  size_t ls = lineStart(off);
  return Utf8::countCodepoints(string_view(text_).substr(ls, off - ls));
}

size_t TextBuffer::lineLength(size_t off) const {
  size_t ls = lineStart(off);
  return Utf8::countCodepoints(string_view(text_).substr(ls, lineEnd(off) - ls));
}

size_t TextBuffer::offsetAtColumn(size_t lineStartOff, size_t col) const {
  size_t end = lineEnd(lineStartOff);
  size_t pos = lineStartOff;
  for (size_t c = 0; c < col && pos < end; ++c) {
    pos = next(pos);
  }
  return pos;
}

string TextBuffer::substr(size_t start, size_t end) const {
  assert(start <= end && end <= text_.size());
  return text_.substr(start, end - start);
}

void TextBuffer::insert(size_t off, string_view text) {
  assert(isBoundary(off));
  assert(Utf8::isValid(text));
  text_.insert(off, text);
}

string TextBuffer::erase(size_t start, size_t end) {
  assert(start <= end && end <= text_.size());
  assert(isBoundary(start) && isBoundary(end));
  string removed = text_.substr(start, end - start);
  text_.erase(start, end - start);
  return removed;
}
