#include <guest/child_process.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace guest {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

[[noreturn]] void ReportExecFailure(int fd, int error) {
  ssize_t rc;
  do {
    rc = ::write(fd, &error, sizeof(error));
  } while (rc < 0 && errno == EINTR);
  ::_exit(127);
}

class Pipe {
public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  int ReadEnd() const { return fds_[0]; }
  int WriteEnd() const { return fds_[1]; }
  void CloseRead() { Close(fds_[0]); }
  void CloseWrite() { Close(fds_[1]); }

private:
  static void Close(int &fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  int fds_[2] = {-1, -1};
};

} // namespace

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)) {}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    Reset();
    pid_ = std::exchange(other.pid_, -1);
    exit_code_ = std::exchange(other.exit_code_, std::nullopt);
  }
  return *this;
}

ChildProcess::~ChildProcess() { Reset(); }

ChildProcess ChildProcess::Spawn(const std::vector<std::string> &argv,
                                 const std::filesystem::path &output_path) {
  if (argv.empty()) {
    throw std::invalid_argument("Cannot spawn an empty command");
  }

  // Everything the child touches is prepared before fork.
  std::vector<char *> arguments;
  arguments.reserve(argv.size() + 1);
  for (const auto &argument : argv) {
    arguments.push_back(const_cast<char *>(argument.c_str()));
  }
  arguments.push_back(nullptr);
  const auto output = output_path.string();

  Pipe exec_status;
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }
  if (pid == 0) {
    if (!output.empty()) {
      const int fd =
          ::open(output.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
      if (fd < 0) {
        ReportExecFailure(exec_status.WriteEnd(), errno);
      }
      ::dup2(fd, STDOUT_FILENO);
      ::dup2(fd, STDERR_FILENO);
    }
    ::execvp(arguments[0], arguments.data());
    ReportExecFailure(exec_status.WriteEnd(), errno);
  }

  exec_status.CloseWrite();
  ChildProcess process(pid);
  int child_error = 0;
  ssize_t rc;
  do {
    rc = ::read(exec_status.ReadEnd(), &child_error, sizeof(child_error));
  } while (rc < 0 && errno == EINTR);
  if (rc == static_cast<ssize_t>(sizeof(child_error))) {
    process.Wait();
    throw std::system_error(child_error, std::generic_category(),
                            "Unable to execute " + argv.front());
  }
  return process;
}

bool ChildProcess::IsRunning() {
  if (pid_ < 0 || exit_code_) {
    return false;
  }
  int status = 0;
  const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
  if (rc == 0) {
    return true;
  }
  exit_code_ = rc == pid_ ? DecodeStatus(status) : -1;
  return false;
}

int ChildProcess::Wait() {
  if (exit_code_) {
    return *exit_code_;
  }
  if (pid_ < 0) {
    throw std::logic_error("Wait() called without a child process");
  }
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid_, &status, 0);
  } while (rc < 0 && errno == EINTR);
  exit_code_ = rc == pid_ ? DecodeStatus(status) : -1;
  return *exit_code_;
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
  if (!IsRunning()) {
    return;
  }
  ::kill(pid_, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!IsRunning()) {
      return;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (IsRunning()) {
    ::kill(pid_, SIGKILL);
    Wait();
  }
}

void ChildProcess::Reset() noexcept {
  if (pid_ >= 0 && !exit_code_) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  pid_ = -1;
  exit_code_.reset();
}

int RunCommand(const std::vector<std::string> &argv) {
  auto process = ChildProcess::Spawn(argv);
  return process.Wait();
}

} // namespace guest
