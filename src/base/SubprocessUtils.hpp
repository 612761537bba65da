#ifndef __WT_SUBPROCESS_UTILS__
#define __WT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace wt {
/**
 * @brief A spawned child with its stdin pipe and combined stdout/stderr pipe.
 *
 * Descriptors are -1 when not requested or already closed.
 */
struct ChildProcess {
  pid_t pid = -1;
  int stdinFd = -1;
  int outputFd = -1;
};

/**
 * @brief Utility class for executing subprocesses without a shell.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command args...`, capturing stdout and stderr into `output`.
   * @return The exit code, or 128 + signal number if the child was killed.
   */
  virtual int runToString(const string& command, const vector<string>& args,
                          string* output);

  /**
   * @brief Forks and execs `argv`.  When `pipeStdin` is set the returned
   * stdinFd is the write end of the child's stdin.
   * @throws std::runtime_error when the pipes or the fork fail.
   */
  static ChildProcess spawn(const vector<string>& argv, bool pipeStdin);

  /** @brief Reads `fd` until EOF and closes it. */
  static string drain(int fd);

  /**
   * @brief Blocks until `pid` exits.
   * @return The exit code, or 128 + signal number.
   */
  static int waitForExit(pid_t pid);

  /**
   * @brief Sends SIGTERM, waits up to `graceMs`, then SIGKILLs and reaps.
   */
  static int terminate(pid_t pid, int graceMs = 1000);
};
}  // namespace wt

#endif  // __WT_SUBPROCESS_UTILS__
