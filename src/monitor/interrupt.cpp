#include "monitor/interrupt.hpp"

#include <csignal>

namespace photoncount::monitor {

namespace {

volatile std::sig_atomic_t g_interrupt_requested = 0;

void HandleInterruptSignal(int /*signal_number*/) {
  g_interrupt_requested = 1;
}

} // namespace

ScopedInterruptHandlers::ScopedInterruptHandlers() {
  ResetInterrupt();
  previous_sigint_ = std::signal(SIGINT, HandleInterruptSignal);
#if defined(SIGTSTP)
  previous_sigtstp_ = std::signal(SIGTSTP, HandleInterruptSignal);
#endif
}

ScopedInterruptHandlers::~ScopedInterruptHandlers() {
  if (previous_sigint_ != SIG_ERR) {
    std::signal(SIGINT, previous_sigint_);
  }
#if defined(SIGTSTP)
  if (previous_sigtstp_ != SIG_ERR) {
    std::signal(SIGTSTP, previous_sigtstp_);
  }
#endif
}

bool InterruptRequested() {
  return g_interrupt_requested != 0;
}

void RequestInterrupt() {
  g_interrupt_requested = 1;
}

void ResetInterrupt() {
  g_interrupt_requested = 0;
}

} // namespace photoncount::monitor
