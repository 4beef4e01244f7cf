/**
 * @file CommandRunner.cpp
 * @brief fork/exec command runner with poll()-based deadline.
 */

#include "src/probe/inc/CommandRunner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace awgcheck {

namespace probe {

namespace {

constexpr std::size_t READ_CHUNK = 4096;
constexpr int EXEC_FAILED_STATUS = 127;

/// Monotonic milliseconds, unaffected by wall clock changes.
std::int64_t monotonicMs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::int64_t>(ts.tv_sec) * 1000 +
         static_cast<std::int64_t>(ts.tv_nsec) / 1'000'000;
}

/// Closes a file descriptor on scope exit.
class FdGuard {
public:
  explicit FdGuard(int fd = -1) noexcept : fd_{fd} {}
  ~FdGuard() noexcept { reset(); }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

/// Wait for @p pid, retrying on EINTR. Returns raw status or -1.
int reap(pid_t pid) noexcept {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

/// Wait for @p pid until @p deadline. False if it is still running then.
bool reapBefore(pid_t pid, std::int64_t deadline, int& status) noexcept {
  constexpr long POLL_INTERVAL_NS = 10'000'000;
  for (;;) {
    const pid_t DONE = ::waitpid(pid, &status, WNOHANG);
    if (DONE == pid) {
      return true;
    }
    if (DONE < 0 && errno != EINTR) {
      status = -1;
      return true;
    }
    if (monotonicMs() >= deadline) {
      return false;
    }
    struct timespec nap{0, POLL_INTERVAL_NS};
    ::nanosleep(&nap, nullptr);
  }
}

/// Child side: wire stdio, chdir, exec. Never returns.
[[noreturn]] void execChild(int outFd, const std::string& workDir, char* const* argv) noexcept {
  // Own process group so a timeout kill reaches grandchildren too
  ::setpgid(0, 0);

  const int NULL_FD = ::open("/dev/null", O_RDWR);
  if (NULL_FD >= 0) {
    ::dup2(NULL_FD, STDIN_FILENO);
    ::dup2(NULL_FD, STDERR_FILENO);
    if (NULL_FD > STDERR_FILENO) {
      ::close(NULL_FD);
    }
  }
  if (::dup2(outFd, STDOUT_FILENO) < 0) {
    ::_exit(EXEC_FAILED_STATUS);
  }
  ::close(outFd);

  if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
    ::_exit(EXEC_FAILED_STATUS);
  }
  ::execvp(argv[0], argv);
  ::_exit(EXEC_FAILED_STATUS);
}

} // namespace

/* ----------------------------- API ----------------------------- */

CommandOutput runCommand(const std::vector<std::string>& argv, const std::string& workDir,
                         int timeoutMs) noexcept {
  CommandOutput result;
  if (argv.empty() || argv.front().empty()) {
    return result;
  }
  const int TIMEOUT = timeoutMs > 0 ? timeoutMs : DEFAULT_COMMAND_TIMEOUT_MS;

  // Build argv before fork; nothing allocates in the child
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return result;
  }
  FdGuard readEnd(fds[0]);
  FdGuard writeEnd(fds[1]);

  const pid_t PID = ::fork();
  if (PID < 0) {
    return result;
  }
  if (PID == 0) {
    ::close(fds[0]);
    execChild(fds[1], workDir, cargv.data());
  }

  result.started = true;
  writeEnd.reset();

  const std::int64_t DEADLINE = monotonicMs() + TIMEOUT;
  std::array<char, READ_CHUNK> chunk{};

  for (;;) {
    const std::int64_t REMAINING = DEADLINE - monotonicMs();
    if (REMAINING <= 0) {
      result.timedOut = true;
      break;
    }

    struct pollfd pfd{};
    pfd.fd = readEnd.get();
    pfd.events = POLLIN;
    const int READY = ::poll(&pfd, 1, static_cast<int>(REMAINING));
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.timedOut = true;
      break;
    }
    if (READY == 0) {
      continue;
    }

    const ssize_t N = ::read(readEnd.get(), chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (N == 0) {
      break;
    }
    const std::size_t ROOM = MAX_COMMAND_OUTPUT - result.output.size();
    result.output.append(chunk.data(), std::min(static_cast<std::size_t>(N), ROOM));
  }

  readEnd.reset();

  // stdout may close before the child exits; the deadline still applies
  int status = -1;
  if (!result.timedOut && !reapBefore(PID, DEADLINE, status)) {
    result.timedOut = true;
  }
  if (result.timedOut) {
    ::kill(-PID, SIGKILL);
    ::kill(PID, SIGKILL);
    status = reap(PID);
  }

  if (!result.timedOut && status >= 0 && WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  }
  return result;
}

} // namespace probe

} // namespace awgcheck
