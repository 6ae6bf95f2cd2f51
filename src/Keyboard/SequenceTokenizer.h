#pragma once

#include <functional>  // for std::less<>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "InputEvent.h"

// Turns vim notation ("ciwfoo<Esc>:w<CR>") into the events a GUI host
// would deliver for those keystrokes.
//
// Printable characters produce a key event (when the character has a key on
// a US layout) followed by a text event carrying the character. Named keys
// like <Esc> or <CR> produce key events only.
class SequenceTokenizer {
public:
  // std::less<> enables transparent comparison (lookup with string_view without allocation)
  using Mapping = std::map<std::string, std::vector<InputEvent>, std::less<>>;

  // Build from the named-key map (it must outlive the tokenizer).
  explicit SequenceTokenizer(const Mapping &named);

  // Throws std::runtime_error on '<' that starts no known name and on
  // invalid UTF-8.
  std::vector<InputEvent> tokenize(std::string_view s) const;

private:
  struct TokenDef {
    std::string token;
    const std::vector<InputEvent> *events; // non-owning, points into mapping
  };

  std::vector<TokenDef> tokens_; // sorted by descending token length
};

// Named keys: <Esc> <CR> <Enter> <BS> <Del> <Tab> <Space> <Left> <Right>
// <Up> <Down> <Home> <End> <lt>
const SequenceTokenizer::Mapping& namedKeys();

const SequenceTokenizer& globalTokenizer();
