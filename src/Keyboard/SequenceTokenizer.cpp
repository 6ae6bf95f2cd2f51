#include "SequenceTokenizer.h"

#include <algorithm>
#include <stdexcept>

#include "CharToKeys.h"
#include "Utils/Utf8.h"

using namespace std;

SequenceTokenizer::SequenceTokenizer(const Mapping &named) {
  tokens_.reserve(named.size());

  for (const auto &p : named) {
    tokens_.push_back(TokenDef{p.first, &p.second});
  }

  // Longest tokens first, so we greedily match "<Enter>" before "<End>".
  sort(tokens_.begin(), tokens_.end(),
            [](const TokenDef &a, const TokenDef &b) {
              if (a.token.size() != b.token.size())
                return a.token.size() > b.token.size();
              return a.token < b.token;
            });
}


vector<InputEvent> SequenceTokenizer::tokenize(string_view s) const {
  size_t bad = Utf8::firstInvalidByte(s);
  if (bad != string_view::npos) {
    throw runtime_error("Key sequence is not valid UTF-8 at position " + to_string(bad));
  }

  vector<InputEvent> out;
  size_t i=0;

  while(i < s.size()){
    bool matched=false;

    for(const auto& td: tokens_){
      const string& tok = td.token;
      const size_t len = tok.size();
      if(len<=s.size()-i && s.compare(i,len,tok)==0){
        const auto& events = *td.events;
        out.insert(out.end(), events.begin(), events.end());
        i += len;
        matched = true;
        break;
      }
    }
    if(matched) continue;

    char ch = s[i];
    if(ch == '<'){
      size_t close = s.find('>', i);
      string preview(s.substr(i, close == string_view::npos ? 8 : close - i + 1));
      throw runtime_error(
        "Unknown or malformed key name at position " + to_string(i) +
        " near '" + preview + "'"
      );
    }
    if(ch == '\n'){
      out.push_back(InputEvent::keyPress(KeyEvent(Key::Key_Enter)));
      ++i;
      continue;
    }

    size_t next = Utf8::nextBoundary(s, i);
    auto it = CHAR_TO_KEYS.find(ch);
    if(it != CHAR_TO_KEYS.end()){
      out.push_back(InputEvent::keyPress(it->second));
    }
    out.push_back(InputEvent::textInput(string(s.substr(i, next - i))));
    i = next;
  }
  return out;
}

const SequenceTokenizer::Mapping& namedKeys() {
  static const SequenceTokenizer::Mapping named = {
    {"<Esc>",   {InputEvent::keyPress(KeyEvent(Key::Key_Esc))}},
    {"<CR>",    {InputEvent::keyPress(KeyEvent(Key::Key_Enter))}},
    {"<Enter>", {InputEvent::keyPress(KeyEvent(Key::Key_Enter))}},
    {"<BS>",    {InputEvent::keyPress(KeyEvent(Key::Key_Backspace))}},
    {"<Del>",   {InputEvent::keyPress(KeyEvent(Key::Key_Delete))}},
    {"<Tab>",   {InputEvent::keyPress(KeyEvent(Key::Key_Tab)), InputEvent::textInput("\t")}},
    {"<Space>", {InputEvent::keyPress(KeyEvent(Key::Key_Space)), InputEvent::textInput(" ")}},
    {"<Left>",  {InputEvent::keyPress(KeyEvent(Key::Key_Left))}},
    {"<Right>", {InputEvent::keyPress(KeyEvent(Key::Key_Right))}},
    {"<Up>",    {InputEvent::keyPress(KeyEvent(Key::Key_Up))}},
    {"<Down>",  {InputEvent::keyPress(KeyEvent(Key::Key_Down))}},
    {"<Home>",  {InputEvent::keyPress(KeyEvent(Key::Key_Home))}},
    {"<End>",   {InputEvent::keyPress(KeyEvent(Key::Key_End))}},
    {"<lt>",    {InputEvent::keyPress(KeyEvent::shifted(Key::Key_Comma)), InputEvent::textInput("<")}},
  };
  return named;
}

const SequenceTokenizer& globalTokenizer() {
  static const SequenceTokenizer tokenizer(namedKeys());
  return tokenizer;
}
