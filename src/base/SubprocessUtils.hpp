#ifndef __TD_SUBPROCESS_UTILS__
#define __TD_SUBPROCESS_UTILS__

#include "Errors.hpp"
#include "Headers.hpp"

namespace td {
/**
 * @brief A spawned child and the read end of its stderr pipe.
 */
struct ChildProcess {
  pid_t pid = -1;
  int errorFd = -1;
};

/**
 * @brief Utility class for spawning long-running subprocesses and reaping
 * them.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments without a shell.
   *
   * The child starts in its own session with no controlling terminal, stdin
   * and stdout on /dev/null and stderr on a pipe returned to the caller. It
   * is sent SIGTERM if this process dies first.
   * @throws ProcessError if the pipe, fork or exec fails.
   */
  virtual ChildProcess spawnWithErrorPipe(const string& command,
                                          const vector<string>& args);

  /**
   * @brief Reaps the child if it has already exited.
   * @return true if the child is gone.
   */
  virtual bool tryReap(pid_t pid, int* status);

  /**
   * @brief Sends SIGTERM, then SIGKILL after graceMs, and reaps the child.
   * @return the wait status, or -1 if the child was already reaped.
   */
  virtual int terminate(pid_t pid, int graceMs);
};
}  // namespace td

#endif  // __TD_SUBPROCESS_UTILS__
