#pragma once

namespace photoncount::monitor {

// Installs SIGINT (and SIGTSTP where the platform has it) handlers that only
// raise a flag. The acquisition loop polls the flag between frames, so the
// current frame always finishes. Previous handlers come back on destruction.
class ScopedInterruptHandlers {
public:
  ScopedInterruptHandlers();
  ~ScopedInterruptHandlers();

  ScopedInterruptHandlers(const ScopedInterruptHandlers&) = delete;
  ScopedInterruptHandlers& operator=(const ScopedInterruptHandlers&) = delete;

private:
  using Handler = void (*)(int);

  Handler previous_sigint_ = nullptr;
  Handler previous_sigtstp_ = nullptr;
};

bool InterruptRequested();

// Same effect as a delivered signal; lets tests stop a session in-process.
void RequestInterrupt();

void ResetInterrupt();

} // namespace photoncount::monitor
