#ifndef AWGCHECK_PROBE_COMMAND_RUNNER_HPP
#define AWGCHECK_PROBE_COMMAND_RUNNER_HPP
/**
 * @file CommandRunner.hpp
 * @brief Run an external command with a deadline and capture its stdout.
 *
 * The child gets /dev/null for stdin and stderr. Output beyond the cap is
 * drained and discarded. On timeout the child is killed with SIGKILL and
 * reaped before returning.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace awgcheck {

namespace probe {

/* ----------------------------- Constants ----------------------------- */

/// Default command deadline.
inline constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 6000;

/// Upper bound on captured stdout.
inline constexpr std::size_t MAX_COMMAND_OUTPUT = 1024 * 1024;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Result of runCommand().
 */
struct CommandOutput {
  bool started = false;  ///< fork/exec succeeded
  bool timedOut = false; ///< Deadline hit, child killed
  int exitCode = -1;     ///< Exit status; -1 if not exited normally
  std::string output;    ///< Captured stdout (capped)

  /// @brief Started, finished in time, exit 0.
  [[nodiscard]] bool succeeded() const noexcept {
    return started && !timedOut && exitCode == 0;
  }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run @p argv (argv[0] looked up on PATH).
 * @param argv Program and arguments; empty argv never starts.
 * @param workDir Directory to chdir into before exec ("" = inherit).
 * @param timeoutMs Deadline in milliseconds (<= 0 uses the default).
 * @note Blocks until the child exits or the deadline passes.
 */
[[nodiscard]] CommandOutput runCommand(const std::vector<std::string>& argv,
                                       const std::string& workDir = {},
                                       int timeoutMs = DEFAULT_COMMAND_TIMEOUT_MS) noexcept;

} // namespace probe

} // namespace awgcheck

#endif // AWGCHECK_PROBE_COMMAND_RUNNER_HPP
