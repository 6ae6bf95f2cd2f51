#pragma once

#include <cstdint>
#include <string>

#include "Keyboard/KeyEvent.h"

enum class Operator : std::uint8_t {
  None,
  Delete,  // d
  Yank,    // y
  Change,  // c
};

// What the key after the operator selected.
enum class OperatorTarget : std::uint8_t {
  Line,       // dd, yy, cc
  Word,       // dw, yw, cw
  InnerWord,  // diw, yiw, ciw
};

// The in-flight part of an operator command. Lives between the operator key
// and the key that completes (or abandons) it; the register is never used
// as scratch space for this.
class OperatorPending {
public:
  struct Step {
    enum class Kind : std::uint8_t {
      Wait,      // consumed, need another key (after "di")
      Complete,  // op + target resolved
      Abandon,   // key is not part of the grammar; reprocess it as normal
    };

    Kind kind = Kind::Abandon;
    Operator op = Operator::None;
    OperatorTarget target = OperatorTarget::Line;
  };

  // d/y/c map to an operator; every other key to Operator::None.
  static Operator operatorForKey(Key key);

  void begin(Operator op);

  // Advance with the next key. Resets itself on Complete and Abandon.
  Step feed(Key key);

  void reset();

  bool active() const { return op_ != Operator::None; }
  Operator op() const { return op_; }
  bool expectingInner() const { return expectingInner_; }

  // "d", "di", ... ; empty when inactive.
  std::string label() const;

private:
  Operator op_ = Operator::None;
  bool expectingInner_ = false;
};

const char* operatorName(Operator op);
