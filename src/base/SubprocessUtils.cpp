#include "SubprocessUtils.hpp"

#include <sys/prctl.h>

namespace td {
ChildProcess SubprocessUtils::spawnWithErrorPipe(const string& command,
                                                 const vector<string>& args) {
  int errorPipe[2];
  if (pipe2(errorPipe, O_CLOEXEC) == -1) {
    throw ProcessError(string("Could not create stderr pipe: ") +
                       strerror(errno));
  }
  // Reports an exec failure back to the parent; closed on a successful exec
  int execStatusPipe[2];
  if (pipe2(execStatusPipe, O_CLOEXEC) == -1) {
    auto localErrno = errno;
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw ProcessError(string("Could not create exec status pipe: ") +
                       strerror(localErrno));
  }

  // Build argv before forking, the child only calls async-signal-safe
  // functions.
  vector<char*> argsArray;
  argsArray.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);
  pid_t parentPid = getpid();

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    setsid();
    prctl(PR_SET_PDEATHSIG, SIGTERM);
    if (getppid() != parentPid) {
      _exit(1);
    }
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull != -1) {
      dup2(devNull, STDIN_FILENO);
      dup2(devNull, STDOUT_FILENO);
    }
    dup2(errorPipe[1], STDERR_FILENO);
    execvp(command.c_str(), argsArray.data());

    int execErrno = errno;
    ssize_t ignored = ::write(execStatusPipe[1], &execErrno, sizeof(int));
    (void)ignored;
    _exit(127);
  } else if (pid < 0) {
    auto localErrno = errno;
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    ::close(execStatusPipe[0]);
    ::close(execStatusPipe[1]);
    throw ProcessError(string("Failed to fork: ") + strerror(localErrno));
  }

  // parent process
  ::close(errorPipe[1]);
  ::close(execStatusPipe[1]);
  int execErrno = 0;
  ssize_t statusBytes;
  do {
    statusBytes = ::read(execStatusPipe[0], &execErrno, sizeof(int));
  } while (statusBytes == -1 && errno == EINTR);
  ::close(execStatusPipe[0]);
  if (statusBytes > 0) {
    ::close(errorPipe[0]);
    waitpid(pid, NULL, 0);
    throw ProcessError("Could not start " + command + ": " +
                       strerror(execErrno));
  }
  VLOG(1) << "Spawned " << command << " as pid " << pid;

  ChildProcess child;
  child.pid = pid;
  child.errorFd = errorPipe[0];
  return child;
}

bool SubprocessUtils::tryReap(pid_t pid, int* status) {
  int localStatus = 0;
  pid_t rc = waitpid(pid, &localStatus, WNOHANG);
  if (rc == pid) {
    if (status) {
      *status = localStatus;
    }
    return true;
  }
  if (rc == -1 && errno == ECHILD) {
    return true;
  }
  return false;
}

int SubprocessUtils::terminate(pid_t pid, int graceMs) {
  int status = 0;
  if (tryReap(pid, &status)) {
    return status;
  }
  VLOG(1) << "Sending SIGTERM to " << pid;
  ::kill(pid, SIGTERM);
  auto deadline =
      chrono::steady_clock::now() + chrono::milliseconds(graceMs);
  while (chrono::steady_clock::now() < deadline) {
    if (tryReap(pid, &status)) {
      return status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  LOG(WARNING) << "Child " << pid << " ignored SIGTERM, sending SIGKILL";
  ::kill(pid, SIGKILL);
  if (waitpid(pid, &status, 0) == -1) {
    return -1;
  }
  return status;
}
}  // namespace td
