#pragma once

#include <cstddef>

// Range represents a span of the document for operator application.
// start/end are byte offsets on codepoint boundaries, end exclusive.
// Used by both motion-based operations (dw, cw) and text objects (diw, ciw).
struct Range {
  std::size_t start = 0;
  std::size_t end = 0;
  bool linewise = false;   // If true, the span is a whole line (dd, yy)

  Range() = default;
  Range(std::size_t s, std::size_t e, bool lw = false)
    : start(s), end(e), linewise(lw) {}

  bool isEmpty() const {
    return end <= start;
  }
};
