#include "VimTextObjects.h"

#include "Editor/TextBuffer.h"
#include "VimUtils.h"

using namespace std;

namespace VimTextObjects {

Range innerWord(const TextBuffer& buf, size_t off) {
  if (off >= buf.size()) {
    return Range(buf.size(), buf.size());
  }

  // Non-word character (blank or punctuation): just that codepoint
  if (!VimUtils::isWordChar(buf.charAt(off))) {
    return Range(off, buf.next(off));
  }

  size_t start = off;
  while (start > 0 && VimUtils::isWordChar(buf.charAt(buf.prev(start)))) {
    start = buf.prev(start);
  }

  size_t end = off;
  while (end < buf.size() && VimUtils::isWordChar(buf.charAt(end))) {
    end = buf.next(end);
  }

  return Range(start, end);
}

Range wordForward(const TextBuffer& buf, size_t off) {
  return Range(off, VimUtils::nextWordStart(buf, off));
}

Range currentLine(const TextBuffer& buf, size_t off) {
  size_t start = buf.lineStart(off);
  size_t end = buf.lineEnd(off);
  if (end < buf.size()) ++end; // take the '\n'
  return Range(start, end, true);
}

Range lineContent(const TextBuffer& buf, size_t off) {
  return Range(buf.lineStart(off), buf.lineEnd(off));
}

} // namespace VimTextObjects
