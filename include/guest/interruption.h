#pragma once

#include <guest/interfaces.h>

#include <chrono>

namespace guest {

// SIGINT and SIGTERM only raise a flag. The poll timer, and the supervisor
// once polling ends, turn it into an InterruptedError.
void InstallInterruptHandlers();
bool InterruptRequested();
void ClearInterruptRequest();

class SleepingPollTimer : public PollTimer {
public:
  explicit SleepingPollTimer(
      std::chrono::milliseconds quantum = std::chrono::seconds(1));

  void Pause() override;

private:
  std::chrono::milliseconds quantum_;
};

} // namespace guest
