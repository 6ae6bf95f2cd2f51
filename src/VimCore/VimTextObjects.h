#pragma once

#include <cstddef>

#include "Editor/Range.h"

class TextBuffer;

// Text objects and operator spans return a Range over the document.
// These are used with operators: dw, ciw, yy, cc, etc.

namespace VimTextObjects {

// iw: the maximal run of word characters containing off, or just the
// codepoint at off when it is not a word character. Empty at end of buffer.
Range innerWord(const TextBuffer& buf, std::size_t off);

// w as an operator target: from off through the rest of the non-blank run
// and the blanks after it.
Range wordForward(const TextBuffer& buf, std::size_t off);

// Whole line containing off, including its '\n' when it has one (linewise).
Range currentLine(const TextBuffer& buf, std::size_t off);

// Content of the line containing off, terminator excluded (charwise).
Range lineContent(const TextBuffer& buf, std::size_t off);

} // namespace VimTextObjects
