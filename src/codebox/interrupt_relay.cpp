#include "interrupt_relay.h"

#include <spdlog/spdlog.h>

bool InterruptRelay::Attach(Interpreter* target) {
  std::lock_guard lck(mtx_);
  if (requested_) return false;
  target_ = target;
  return true;
}

void InterruptRelay::Detach() {
  std::lock_guard lck(mtx_);
  target_ = nullptr;
}

void InterruptRelay::Request() {
  std::lock_guard lck(mtx_);
  requested_ = true;
  if (target_) {
    target_->Interrupt();
  } else {
    spdlog::info("Interruption requested; stopping after the sandbox is set up");
  }
}

bool InterruptRelay::Requested() const {
  std::lock_guard lck(mtx_);
  return requested_;
}
