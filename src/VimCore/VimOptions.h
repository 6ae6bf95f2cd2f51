#pragma once

// VimOptions.h - Compile-time options for word classification
//
// By default, vimnote classifies characters by Unicode property (ICU):
// '_' and every Alphabetic or numeric (Nd, Nl, No) codepoint is a word
// character. Punctuation, symbols, whitespace and emoji are not.
// Define VIMNOTE_ASCII_WORDS to treat every non-ASCII codepoint as a
// non-word character instead (matches Vim with 'iskeyword' left at @,48-57,_
// on a non-UTF-8 encoding).
//
// Affects: inner word (diw, ciw). Whitespace detection for w/b/dw is
// always Unicode-aware.

namespace VimOptions {

constexpr bool asciiWordsOnly() {
#ifdef VIMNOTE_ASCII_WORDS
    return true;
#else
    return false;
#endif
}

} // namespace VimOptions
