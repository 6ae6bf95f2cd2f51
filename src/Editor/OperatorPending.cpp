#include "OperatorPending.h"

using namespace std;

static Key keyForOperator(Operator op) {
  switch (op) {
    case Operator::Delete: return Key::Key_D;
    case Operator::Yank: return Key::Key_Y;
    case Operator::Change: return Key::Key_C;
    case Operator::None: break;
  }
  return Key::None;
}

Operator OperatorPending::operatorForKey(Key key) {
  switch (key) {
    case Key::Key_D: return Operator::Delete;
    case Key::Key_Y: return Operator::Yank;
    case Key::Key_C: return Operator::Change;
    default: return Operator::None;
  }
}

void OperatorPending::begin(Operator op) {
  op_ = op;
  expectingInner_ = false;
}

void OperatorPending::reset() {
  op_ = Operator::None;
  expectingInner_ = false;
}

OperatorPending::Step OperatorPending::feed(Key key) {
  Step step;
  step.op = op_;

  if (op_ == Operator::None) {
    return step;
  }

  if (expectingInner_) {
    // Only iw is defined
    if (key == Key::Key_W) {
      step.kind = Step::Kind::Complete;
      step.target = OperatorTarget::InnerWord;
    }
    reset();
    return step;
  }

  if (key == keyForOperator(op_)) {
    step.kind = Step::Kind::Complete;
    step.target = OperatorTarget::Line;
  } else if (key == Key::Key_W) {
    step.kind = Step::Kind::Complete;
    step.target = OperatorTarget::Word;
  } else if (key == Key::Key_I) {
    expectingInner_ = true;
    step.kind = Step::Kind::Wait;
    return step;
  }

  reset();
  return step;
}

string OperatorPending::label() const {
  string s = operatorName(op_);
  if (expectingInner_) s += 'i';
  return s;
}

const char* operatorName(Operator op) {
  switch (op) {
    case Operator::Delete: return "d";
    case Operator::Yank: return "y";
    case Operator::Change: return "c";
    case Operator::None: break;
  }
  return "";
}
