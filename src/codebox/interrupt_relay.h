#ifndef CODEBOX_INTERRUPT_RELAY_H_
#define CODEBOX_INTERRUPT_RELAY_H_

#include <mutex>

#include <codebox/interpreter.h>

// Forwards interruption requests from a signal thread to the interpreter of the current run.
// A request that arrives while nothing is attached (construction, staging of the workspace)
//   is remembered, so the owner can tear the container down itself instead of exiting.
// The attached interpreter is never destroyed while Request() is using it: Detach() waits for it.
class InterruptRelay {
  mutable std::mutex mtx_;
  Interpreter* target_ = nullptr;
  bool requested_ = false;
 public:
  // returns false (and attaches nothing) if an interruption was already requested
  bool Attach(Interpreter* target);
  void Detach();
  void Request();
  bool Requested() const;
};

#endif  // CODEBOX_INTERRUPT_RELAY_H_
