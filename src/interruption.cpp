#include <guest/interruption.h>

#include <guest/errors.h>

#include <signal.h>

#include <csignal>
#include <thread>

namespace guest {

namespace {

volatile std::sig_atomic_t interrupt_requested = 0;

void HandleInterrupt(int) { interrupt_requested = 1; }

} // namespace

void InstallInterruptHandlers() {
  struct sigaction action {};
  action.sa_handler = HandleInterrupt;
  sigemptyset(&action.sa_mask);
  ::sigaction(SIGINT, &action, nullptr);
  ::sigaction(SIGTERM, &action, nullptr);
}

bool InterruptRequested() { return interrupt_requested != 0; }

void ClearInterruptRequest() { interrupt_requested = 0; }

SleepingPollTimer::SleepingPollTimer(std::chrono::milliseconds quantum)
    : quantum_(quantum) {}

void SleepingPollTimer::Pause() {
  std::this_thread::sleep_for(quantum_);
  if (InterruptRequested()) {
    throw InterruptedError();
  }
}

} // namespace guest
