#pragma once

#include <string>
#include <utility>

// The unnamed register: a single slot holding the last yanked, deleted or
// changed text. Every store overwrites; paste only reads.
class Register {
public:
  void store(std::string text) { text_ = std::move(text); }

  const std::string& content() const { return text_; }
  bool empty() const { return text_.empty(); }

  // Content with an embedded line terminator pastes line-wise.
  bool isLinewise() const { return text_.find('\n') != std::string::npos; }

private:
  std::string text_;
};
