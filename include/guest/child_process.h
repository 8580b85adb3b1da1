#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace guest {

// Owns a forked child. The destructor terminates and reaps it.
class ChildProcess {
public:
  ChildProcess() = default;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;
  ~ChildProcess();

  static ChildProcess Spawn(const std::vector<std::string> &argv,
                            const std::filesystem::path &output_path = {});

  pid_t Pid() const { return pid_; }
  bool IsRunning();
  std::optional<int> ExitCode() const { return exit_code_; }
  int Wait();
  // SIGTERM, then SIGKILL once the grace period expires.
  void Terminate(std::chrono::milliseconds grace);

private:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}
  void Reset() noexcept;

  pid_t pid_ = -1;
  std::optional<int> exit_code_;
};

int RunCommand(const std::vector<std::string> &argv);

} // namespace guest
