#pragma once

// One-shot guard against the text event a GUI host sends right after the
// key event that switched modes (the "i" of an i keypress must not be
// inserted). Armed by the mode switch, spent by the next text event, and
// dropped by the next key event if no text event came in between.
class SuppressionToken {
public:
  void arm() { armed_ = true; }
  void discard() { armed_ = false; }

  // True exactly once after arm().
  bool consume() {
    bool was = armed_;
    armed_ = false;
    return was;
  }

  bool armed() const { return armed_; }

private:
  bool armed_ = false;
};
