#include "Utf8.h"

using namespace std;

namespace Utf8 {

size_t nextBoundary(string_view s, size_t off) {
  if (off >= s.size()) return s.size();
  ++off;
  while (off < s.size() && isContinuation(static_cast<unsigned char>(s[off]))) {
    ++off;
  }
  return off;
}

size_t prevBoundary(string_view s, size_t off) {
  if (off == 0) return 0;
  if (off > s.size()) off = s.size();
  --off;
  while (off > 0 && isContinuation(static_cast<unsigned char>(s[off]))) {
    --off;
  }
  return off;
}

size_t floorBoundary(string_view s, size_t off) {
  if (off >= s.size()) return s.size();
  while (off > 0 && isContinuation(static_cast<unsigned char>(s[off]))) {
    --off;
  }
  return off;
}

char32_t decodeAt(string_view s, size_t off) {
  if (off >= s.size()) return 0;
  unsigned char c = static_cast<unsigned char>(s[off]);
  size_t len = sequenceLength(c);
  if (len == 1) return c;

  char32_t val = 0;
  switch (len) {
    case 2: val = c & 0x1F; break;
    case 3: val = c & 0x0F; break;
    default: val = c & 0x07; break;
  }
  for (size_t i = 1; i < len && off + i < s.size(); ++i) {
    val = (val << 6) | (static_cast<unsigned char>(s[off + i]) & 0x3F);
  }
  return val;
}

size_t firstInvalidByte(string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len = sequenceLength(c);
    if (len == 1 || c == 0xC0 || c == 0xC1 || c > 0xF4) return i;
    if (i + len > s.size()) return i;

    for (size_t k = 1; k < len; ++k) {
      if (!isContinuation(static_cast<unsigned char>(s[i + k]))) return i;
    }

    char32_t cp = decodeAt(s, i);
    // Overlong 3/4-byte forms, UTF-16 surrogates, out of range
    if (len == 3 && cp < 0x800) return i;
    if (len == 4 && cp < 0x10000) return i;
    if (cp >= 0xD800 && cp <= 0xDFFF) return i;
    if (cp > 0x10FFFF) return i;

    i += len;
  }
  return string_view::npos;
}

size_t countCodepoints(string_view s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if (!isContinuation(c)) ++n;
  }
  return n;
}

} // namespace Utf8
